/**
 * @file Group.cpp
 * @brief Implementation of the group tree
 */

#include "tomlet/Group.hpp"
#include "tomlet/DotPath.hpp"
#include "tomlet/Errors.hpp"
#include "tomlet/LineSource.hpp"
#include "tomlet/Parser.hpp"
#include "tomlet/Serializer.hpp"

namespace tomlet {

Group::Group(std::string key)
    : key_(std::move(key))
    , has_parent_(false)
{}

Group::Group(std::string parent_key, std::string key)
    : key_(std::move(key))
    , parent_key_(std::move(parent_key))
    , has_parent_(true)
{}

std::string Group::full_key() const {
    return append_dot_path(parent_key_, key_);
}

const Group* Group::find_child(const std::string& key) const noexcept {
    auto it = child_index_.find(key);
    if (it == child_index_.end()) {
        return nullptr;
    }
    return children_[it->second].get();
}

Group* Group::find_child(const std::string& key) noexcept {
    auto it = child_index_.find(key);
    if (it == child_index_.end()) {
        return nullptr;
    }
    return children_[it->second].get();
}

const Entry* Group::find_item(const std::string& key) const noexcept {
    auto it = item_index_.find(key);
    if (it == item_index_.end()) {
        return nullptr;
    }
    return items_[it->second].get();
}

const Group* Group::find_group(const std::string& path) const {
    const Group* current = this;
    for (const auto& seg : split_dot_path(path)) {
        current = current->find_child(seg);
        if (current == nullptr) {
            return nullptr;
        }
    }
    return current;
}

const Group& Group::get_group(const std::string& path) const {
    const Group* current = this;
    for (const auto& seg : split_dot_path(path)) {
        const Group* next = current->find_child(seg);
        if (next == nullptr) {
            throw KeyError(path, seg);
        }
        current = next;
    }
    return *current;
}

bool Group::group_exists(const std::string& path) const {
    return find_group(path) != nullptr;
}

Group& Group::create_group(const std::string& path) {
    Group* current = this;
    for (const auto& seg : split_dot_path(path)) {
        if (seg.empty()) {
            throw InvalidOperationError(path, "Empty key segment");
        }

        const std::string child_key = append_dot_path(current->full_key(), seg);
        if (current->find_item(seg) != nullptr) {
            throw DuplicateKeyError(child_key);
        }

        Group* child = current->find_child(seg);
        if (child == nullptr) {
            // create the missing child group
            current->children_.push_back(
                std::make_unique<Group>(current->full_key(), seg));
            current->child_index_.emplace(seg, current->children_.size() - 1);
            child = current->children_.back().get();
        }
        current = child;
    }
    return *current;
}

void Group::add_value(std::unique_ptr<Entry> entry) {
    if (!entry) {
        throw InvalidOperationError(full_key(), "Cannot add a null entry");
    }

    const std::string full_name = entry->full_name();
    std::string relative = full_name;

    const std::string own_key = full_key();
    if (!own_key.empty()) {
        const std::string prefix = own_key + kKeySeparator;
        if (full_name.compare(0, prefix.size(), prefix) != 0) {
            throw InvalidOperationError(full_name,
                "Cannot add a value to a group it doesn't belong to");
        }
        relative = full_name.substr(prefix.size());
    }

    auto segments = split_dot_path(relative);
    if (segments.empty() || segments.back().empty()) {
        throw InvalidOperationError(full_name, "Empty value name");
    }

    const std::string last = segments.back();
    segments.pop_back();

    Group& target = create_group(join_dot_path(segments));
    if (target.find_item(last) != nullptr || target.find_child(last) != nullptr) {
        throw DuplicateKeyError(full_name);
    }

    target.items_.push_back(std::move(entry));
    target.item_index_.emplace(last, target.items_.size() - 1);
}

void Group::add_json_value(const std::string& key, const nlohmann::json& value) {
    const std::string own_key = full_key();
    if (key.empty()) {
        throw InvalidOperationError(own_key, "Cannot add a value with an empty key");
    }

    const std::string path = append_dot_path(own_key, key);
    if (value.is_null()) {
        throw InvalidOperationError(path, "Cannot add a null value");
    }

    // Read "key = literal" back below a header naming this group
    std::string text;
    std::size_t expected_tokens = 1;
    if (!own_key.empty()) {
        text = "[" + own_key + "]\n";
        ++expected_tokens;
    }
    text += key + " = " + Serializer::literal(value, path);

    Parser parser(std::make_unique<StringLineSource>(text));
    std::vector<Token> tokens;
    while (auto token = parser.next()) {
        tokens.push_back(std::move(*token));
    }

    // A key carrying its own line break or header would yield extra tokens
    if (tokens.size() != expected_tokens || tokens.back().kind != TokenKind::Value) {
        throw InvalidOperationError(path, "Invalid key");
    }
    add_value(std::move(tokens.back().entry));
}

const Entry* Group::find_value(const std::string& path) const {
    auto segments = split_dot_path(path);
    if (segments.empty()) {
        return nullptr;
    }

    const Group* current = this;
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        current = current->find_child(segments[i]);
        if (current == nullptr) {
            return nullptr;
        }
    }
    return current->find_item(segments.back());
}

const Entry& Group::get_value(const std::string& path) const {
    auto segments = split_dot_path(path);
    if (segments.empty()) {
        throw KeyError(path, "");
    }

    const Group* current = this;
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        const Group* next = current->find_child(segments[i]);
        if (next == nullptr) {
            throw KeyError(path, segments[i]);
        }
        current = next;
    }

    const Entry* entry = current->find_item(segments.back());
    if (entry == nullptr) {
        throw KeyError(path, segments.back());
    }
    return *entry;
}

bool Group::try_get_value(const std::string& path, const Entry*& entry) const {
    entry = find_value(path);
    return entry != nullptr;
}

void Group::collect_items(std::vector<std::pair<std::string, const Entry*>>& out) const {
    for (const auto& item : items_) {
        out.emplace_back(item->full_name(), item.get());
    }
    for (const auto& child : children_) {
        child->collect_items(out);
    }
}

std::vector<std::pair<std::string, const Entry*>> Group::all_items() const {
    std::vector<std::pair<std::string, const Entry*>> out;
    collect_items(out);
    return out;
}

std::string Group::to_string() const {
    std::string value;
    if (!key_.empty()) {
        value += "[" + full_key() + "]\n";
    }

    for (const auto& item : items_) {
        value += item->to_string() + "\n";
    }

    for (const auto& child : children_) {
        value += child->to_string();
        value += "\n";
    }

    return value;
}

} // namespace tomlet
