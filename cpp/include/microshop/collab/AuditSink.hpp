/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <ostream>
#include <string>

namespace microshop::collab {

/// Something that happened to a domain object, e.g. {"order.created", "ORD-1", {{"user_id", "u1"}}}.
struct AuditEvent {
    std::string action;
    std::string subject;
    std::map<std::string, std::string> fields;
};

/**
 * AuditSink - destination for audit events
 *
 * record() is best-effort from the caller's point of view: callers log a
 * failure and carry on.
 */
class AuditSink {
public:
    virtual ~AuditSink() = default;
    virtual void record(const AuditEvent& event) = 0;
};

/// Writes one JSON object per line.
class ConsoleAuditSink : public AuditSink {
public:
    explicit ConsoleAuditSink(std::ostream& out);
    ConsoleAuditSink();

    void record(const AuditEvent& event) override;

    std::uint64_t recorded() const;

private:
    std::ostream& out_;
    mutable std::mutex mutex_;
    std::uint64_t recorded_ = 0;
};

} // namespace microshop::collab
