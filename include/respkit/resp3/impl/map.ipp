#include <respkit/logger.hpp>
#include <respkit/resp3/equal.hpp>
#include <respkit/resp3/hash.hpp>
#include <respkit/resp3/message.hpp>

namespace respkit::resp3 {

auto map::insert(message key, message value) -> expected<void, std::error_code> {
  auto key_kind = key.get_kind();
  auto [pos, inserted] = table_.try_emplace(std::move(key), std::move(value));
  if (!inserted) {
    RESPKIT_LOG_DEBUG("map insert rejected: {} key collides with entry #{}", kind_name(key_kind),
                      pos);
    return unexpected(make_error_code(error::map_key_collision));
  }
  return {};
}

auto map::insert_or_assign(message key, message value) -> bool {
  return table_.insert_or_assign(std::move(key), std::move(value)).second;
}

auto map::find(const message& key) const -> const message* {
  const auto* entry = table_.find(key);
  return entry == nullptr ? nullptr : &entry->second;
}

auto map::contains(const message& key) const -> bool { return table_.find(key) != nullptr; }

auto map::size() const noexcept -> std::size_t { return table_.size(); }

auto map::empty() const noexcept -> bool { return table_.empty(); }

auto map::begin() const noexcept -> const_iterator { return table_.begin(); }

auto map::end() const noexcept -> const_iterator { return table_.end(); }

void map::clear() noexcept { table_.clear(); }

}  // namespace respkit::resp3
