#include "json_store.hpp"
#include "../store_registry.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <stdexcept>

static finly::StoreRegistrar reg_json("json",
    [](const finly::Config& config) {
        return std::make_unique<finly::JsonStore>(config.store_path());
    });

namespace finly {

JsonStore::JsonStore(const std::string& path) : path_(path) {
    load();
}

void JsonStore::load() {
    std::ifstream file(path_);
    if (!file.is_open()) return;

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        if (!j.is_object()) return;

        entries_.clear();
        for (auto& [key, value] : j.items()) {
            if (value.is_string()) entries_[key] = value.get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[store] Corrupt " << path_ << ", starting empty: "
                  << e.what() << '\n';
        entries_.clear();
    }
}

void JsonStore::save() {
    // Must be called with mutex_ already held.
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [key, value] : entries_) {
        j[key] = value;
    }
    if (!atomic_write_file(path_, j.dump(2))) {
        throw std::runtime_error("JsonStore: failed to write " + path_);
    }
}

std::optional<std::string> JsonStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

void JsonStore::commit(std::map<std::string, std::string> next) {
    // Must be called with mutex_ already held. entries_ only changes once
    // the file write succeeded.
    std::swap(entries_, next);
    try {
        save();
    } catch (...) {
        std::swap(entries_, next);
        throw;
    }
}

void JsonStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto next = entries_;
    next[key] = value;
    commit(std::move(next));
}

bool JsonStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.find(key) == entries_.end()) return false;
    auto next = entries_;
    next.erase(key);
    commit(std::move(next));
    return true;
}

size_t JsonStore::remove_many(const std::vector<std::string>& keys) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto next = entries_;
    size_t removed = 0;
    for (const auto& key : keys) {
        removed += next.erase(key);
    }
    if (removed > 0) commit(std::move(next));
    return removed;
}

std::vector<std::string> JsonStore::keys_with_prefix(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    for (auto it = entries_.lower_bound(prefix); it != entries_.end(); ++it) {
        if (!starts_with(it->first, prefix)) break;
        keys.push_back(it->first);
    }
    return keys;
}

} // namespace finly
