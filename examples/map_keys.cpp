#include <respkit/config.hpp>
#include <respkit/resp3/resp3.hpp>

#include <cstdint>
#include <iostream>
#include <string_view>
#include <tuple>
#include <utility>

using namespace respkit::resp3;

// Builds a map keyed by composite values, sizes it for the wire and looks
// entries up structurally.
int main() {
  respkit::configure({.level = respkit::log_level::debug});

  auto point = [](std::int64_t x, std::int64_t y) {
    array a;
    a.elements.push_back(message{number{x}});
    a.elements.push_back(message{number{y}});
    return message{std::move(a)};
  };

  map grid;
  for (auto [x, y, label] : {std::tuple{0, 0, std::string_view{"origin"}},
                             std::tuple{1, 0, std::string_view{"east"}},
                             std::tuple{0, 1, std::string_view{"north"}}}) {
    if (auto res = grid.insert(point(x, y), message{simple_string{label}}); !res) {
      std::cerr << "insert failed: " << res.error().message() << "\n";
      return 1;
    }
  }

  // Rejected: an equal key already exists. Logged at debug level.
  if (auto res = grid.insert(point(0, 0), message{simple_string{"again"}}); !res) {
    std::cout << "duplicate (0,0): " << res.error().message() << "\n";
  }

  message msg{std::move(grid)};
  std::cout << "encoded length: " << encoded_length(msg) << " bytes\n";
  std::cout << "hash: " << hash(msg) << "\n";

  if (const auto* label = msg.as<map>().find(point(1, 0))) {
    std::cout << "(1,0) => " << label->as<simple_string>().data << "\n";
  }
  return 0;
}
