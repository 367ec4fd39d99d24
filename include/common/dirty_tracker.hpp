/*
 * File: include/common/dirty_tracker.hpp
 * Project: TAIS Track Relay
 * Purpose: Facilities touched since the last broadcast cycle
 * Last updated: 2026-10-18
 */

#pragma once
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>


class DirtyTracker {
mutable std::mutex m_;
std::unordered_set<std::string> dirty_;
public:
void mark_dirty(const std::string& facility){ std::scoped_lock lk(m_); dirty_.insert(facility); }

std::vector<std::string> drain(){
std::unordered_set<std::string> taken;
{ std::scoped_lock lk(m_); taken.swap(dirty_); }
return std::vector<std::string>(taken.begin(), taken.end());
}

bool empty() const { std::scoped_lock lk(m_); return dirty_.empty(); }
std::size_t size() const { std::scoped_lock lk(m_); return dirty_.size(); }
};
