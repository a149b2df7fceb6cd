/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#include <iostream>
#include <list>
#include <map>
#include <string>
#include <vector>

#include "microshop/act/ActorSystem.hpp"

using namespace microshop;
using namespace std;

const char* microshop::to_string(MailboxState state)
{
  switch (state)
  {
  case MailboxState::Starting:
    return "Starting";
  case MailboxState::Running:
    return "Running";
  case MailboxState::Stopping:
    return "Stopping";
  case MailboxState::Stopped:
    return "Stopped";
  }
  return "Unknown";
}

ActorSystem::ActorSystem(string name) : name_(std::move(name)) {}

ActorSystem::~ActorSystem()
{
  shutdown();
}

void ActorSystem::register_cell(const string& name, CellPtr cell)
{
  lock_guard<mutex> lock(mutex_);
  if (shut_down_)
    throw ActorError("ActorSystem '" + name_ + "' is shut down");

  if (live_.find(name) != live_.end())
  {
    cerr << "ActorSystem: refusing to spawn '" << name << "', name already in use" << endl;
    throw DuplicateActorError(name);
  }

  cell->start();
  live_[name] = cell;
  cout << "ActorSystem: spawned " << cell->id().to_string() << endl;
}

ActorSystem::CellPtr ActorSystem::live_cell(const ActorId& id) const
{
  lock_guard<mutex> lock(mutex_);
  auto it = live_.find(id.name());
  if (it == live_.end() || it->second->id() != id)
    return nullptr;
  return it->second;
}

ActorSystem::CellPtr ActorSystem::any_cell(const ActorId& id) const
{
  if (auto cell = live_cell(id))
    return cell;

  lock_guard<mutex> lock(mutex_);
  for (auto& cell : retired_)
  {
    if (cell->id() == id)
      return cell;
  }
  return nullptr;
}

void ActorSystem::dead_letter(const ActorId& id)
{
  dead_letters_.fetch_add(1);
  throw DeadLetterError(id.to_string());
}

bool ActorSystem::stop(const ActorId& id)
{
  auto cell = live_cell(id);
  if (!cell)
    return false;

  if (!cell->request_stop())
    return false;

  cout << "ActorSystem: stopping " << id.to_string() << endl;
  reap();
  return true;
}

bool ActorSystem::await_stopped(const ActorId& id, chrono::milliseconds timeout)
{
  auto cell = any_cell(id);
  if (!cell)
    return true;
  return cell->wait_for_state(MailboxState::Stopped, timeout);
}

void ActorSystem::on_exit(const ActorId& id)
{
  lock_guard<mutex> lock(mutex_);
  auto it = live_.find(id.name());
  if (it != live_.end() && it->second->id() == id)
  {
    retired_.push_back(it->second);
    live_.erase(it);
  }
}

void ActorSystem::reap()
{
  list<CellPtr> finished;
  {
    lock_guard<mutex> lock(mutex_);
    for (auto it = retired_.begin(); it != retired_.end();)
    {
      if ((*it)->state() == MailboxState::Stopped)
      {
        finished.push_back(*it);
        it = retired_.erase(it);
      }
      else
        ++it;
    }
  }

  for (auto& cell : finished)
    cell->join();
}

void ActorSystem::shutdown()
{
  vector<CellPtr> cells;
  {
    lock_guard<mutex> lock(mutex_);
    if (shut_down_ && live_.empty() && retired_.empty())
      return;
    shut_down_ = true;
    for (auto& [name, cell] : live_)
      cells.push_back(cell);
    for (auto& cell : retired_)
      cells.push_back(cell);
  }

  for (auto& cell : cells)
    cell->request_stop();

  for (auto& cell : cells)
    cell->join();

  {
    lock_guard<mutex> lock(mutex_);
    live_.clear();
    retired_.clear();
    // Called from a handler: that actor is still running on this thread, so
    // it stays retired until a later shutdown() (the destructor) joins it.
    for (auto& cell : cells)
    {
      if (cell->on_own_thread())
        retired_.push_back(cell);
    }
  }
  cout << "ActorSystem: '" << name_ << "' shut down, " << cells.size() << " actor(s) joined" << endl;
}

MailboxState ActorSystem::state(const ActorId& id) const
{
  if (auto cell = any_cell(id))
    return cell->state();
  return MailboxState::Stopped;
}

optional<ActorId> ActorSystem::find(const string& name) const
{
  lock_guard<mutex> lock(mutex_);
  auto it = live_.find(name);
  if (it == live_.end())
    return nullopt;
  return it->second->id();
}

list<string> ActorSystem::names() const
{
  lock_guard<mutex> lock(mutex_);
  list<string> ret;
  for (auto& [name, _] : live_)
    ret.push_back(name);
  return ret;
}

map<string, size_t> ActorSystem::get_queue_lengths() const
{
  lock_guard<mutex> lock(mutex_);
  map<string, size_t> ret;
  for (auto& [name, cell] : live_)
    ret[name] = cell->queue_length();
  return ret;
}

map<string, uint64_t> ActorSystem::get_message_counts() const
{
  lock_guard<mutex> lock(mutex_);
  map<string, uint64_t> ret;
  for (auto& [name, cell] : live_)
    ret[name] = cell->message_count();
  return ret;
}
