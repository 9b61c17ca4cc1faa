/**
 * @file Group.hpp
 * @brief Key-namespace tree node
 *
 * A Group owns its child groups and its value entries, both keyed by
 * local key and kept in insertion order. Groups are addressed by their
 * full key ("servers.alpha"); the parent is remembered by its full key
 * rather than by pointer, so the tree only holds downward ownership.
 */

#ifndef TOMLET_GROUP_HPP
#define TOMLET_GROUP_HPP

#include "tomlet/Entry.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace tomlet {

class Group {
public:
    /**
     * @brief Construct a root group (no parent)
     */
    explicit Group(std::string key);

    /**
     * @brief Construct a child group
     * @param parent_key Full key of the parent ("" if the parent is the root)
     * @param key Local key
     */
    Group(std::string parent_key, std::string key);

    virtual ~Group() = default;

    Group(const Group&) = delete;
    Group& operator=(const Group&) = delete;
    Group(Group&&) = default;
    Group& operator=(Group&&) = default;

    const std::string& key() const noexcept { return key_; }

    /**
     * @brief Full key: parent's full key + "." + key, or key alone
     */
    std::string full_key() const;

    /**
     * @brief Full key of the parent ("" for the root and its children)
     */
    const std::string& parent_key() const noexcept { return parent_key_; }

    bool has_parent() const noexcept { return has_parent_; }

    const std::vector<std::unique_ptr<Group>>& children() const noexcept {
        return children_;
    }

    const std::vector<std::unique_ptr<Entry>>& items() const noexcept {
        return items_;
    }

    /**
     * @brief Every entry from this node down, paired with its full name
     *
     * Depth-first: a node's own items (in insertion order) come before
     * the items of its children.
     */
    std::vector<std::pair<std::string, const Entry*>> all_items() const;

    /**
     * @brief Resolve a group by path relative to this group
     * @return nullptr if any segment is absent; this for an empty path
     */
    const Group* find_group(const std::string& path) const;

    /**
     * @brief Resolve a group by path relative to this group
     * @throws KeyError naming the first missing segment
     */
    const Group& get_group(const std::string& path) const;

    /**
     * @brief Check that every segment of the path is a group
     */
    bool group_exists(const std::string& path) const;

    /**
     * @brief Create (or reuse) every group along the path
     *
     * @return The group at the end of the path (this for an empty path)
     * @throws DuplicateKeyError if a segment is already used by a value
     * @throws InvalidOperationError if a segment is empty
     */
    Group& create_group(const std::string& path);

    /**
     * @brief Insert an entry under its full name
     *
     * Intermediate groups are created as needed. The entry's full name
     * must lie below this group's full key.
     *
     * @throws DuplicateKeyError if the final key already names a value
     *         or a group
     * @throws InvalidOperationError if the entry doesn't belong here
     */
    void add_value(std::unique_ptr<Entry> entry);

    /**
     * @brief Insert a native value under a key relative to this group
     *
     * The value is written as a literal through Serializer::literal and
     * read back by the Parser, so it gets the same type and source text
     * as parsed input. The key may be dotted.
     *
     * Example:
     * ```cpp
     * root.add_value("server.port", 8080);
     * root.add_value("server.hosts", std::vector<std::string>{"a", "b"});
     * ```
     *
     * @throws InvalidOperationError if the key is empty or the value is null
     * @throws SerializeError if the value has no literal form (an object)
     * @throws ParseError if the key is not a valid identifier path
     * @throws DuplicateKeyError if the key is already used
     */
    template <typename T>
    void add_value(const std::string& key, const T& value) {
        add_json_value(key, nlohmann::json(value));
    }

    /**
     * @brief Resolve an entry by path relative to this group
     * @return nullptr if not found
     */
    const Entry* find_value(const std::string& path) const;

    /**
     * @brief Resolve an entry by path relative to this group
     * @throws KeyError if any segment is absent
     */
    const Entry& get_value(const std::string& path) const;

    /**
     * @brief Resolve an entry without throwing
     * @param path Dot-path relative to this group
     * @param entry Set to the entry, or nullptr when not found
     * @return true if found
     */
    bool try_get_value(const std::string& path, const Entry*& entry) const;

    /**
     * @brief Diagnostic dump: "[full.key]" headers and one line per item
     */
    std::string to_string() const;

private:
    std::string key_;
    std::string parent_key_;
    bool has_parent_;

    std::vector<std::unique_ptr<Group>> children_;
    std::map<std::string, std::size_t> child_index_;

    std::vector<std::unique_ptr<Entry>> items_;
    std::map<std::string, std::size_t> item_index_;

    void add_json_value(const std::string& key, const nlohmann::json& value);

    const Group* find_child(const std::string& key) const noexcept;
    Group* find_child(const std::string& key) noexcept;
    const Entry* find_item(const std::string& key) const noexcept;

    void collect_items(std::vector<std::pair<std::string, const Entry*>>& out) const;
};

} // namespace tomlet

#endif // TOMLET_GROUP_HPP
