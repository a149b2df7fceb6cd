/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#include "microshop/collab/AuditSink.hpp"
#include <cstdio>
#include <iostream>

namespace microshop::collab {

namespace {

std::string quote(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                out += buf;
            } else {
                out += c;
            }
        }
    }
    out += '"';
    return out;
}

} // namespace

ConsoleAuditSink::ConsoleAuditSink(std::ostream& out) : out_(out) {}

ConsoleAuditSink::ConsoleAuditSink() : out_(std::cout) {}

void ConsoleAuditSink::record(const AuditEvent& event) {
    std::string line = "{\"action\":" + quote(event.action) + ",\"subject\":" + quote(event.subject);
    for (const auto& [key, value] : event.fields) {
        line += "," + quote(key) + ":" + quote(value);
    }
    line += "}";

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << std::endl;
    ++recorded_;
}

std::uint64_t ConsoleAuditSink::recorded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return recorded_;
}

} // namespace microshop::collab
