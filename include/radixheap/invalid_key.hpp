#pragma once

#include <stdexcept>
#include <string>

namespace radixheap {

/**
 * Thrown when inserting a key smaller than the most recently extracted one.
 *
 * The heap is left untouched, so callers may catch this and carry on.
 */
template <typename Key>
class InvalidKey : public std::invalid_argument {
public:
    InvalidKey(Key key, Key last_key)
        : std::invalid_argument("radixheap: key " + std::to_string(key) +
                                " is smaller than last extracted key " +
                                std::to_string(last_key)),
          key_(key), last_key_(last_key) {}

    Key key() const noexcept { return key_; }
    Key lastKey() const noexcept { return last_key_; }

private:
    Key key_;
    Key last_key_;
};

} // namespace radixheap
