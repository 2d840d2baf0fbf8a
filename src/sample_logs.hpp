#pragma once
#include <cstddef>
#include <cstdint>
#include <random>
#include <string>

namespace linescrub {
namespace sample_logs {

// Produces synthetic log lines full of fake PII. The same seed always
// yields the same sequence of lines.
class LogGenerator {
public:
    explicit LogGenerator(uint32_t seed = 42);

    std::string next_line();

private:
    int randint(int lo, int hi);
    template <class T, std::size_t N>
    const T& choice(const T (&items)[N]) {
        return items[static_cast<std::size_t>(randint(0, static_cast<int>(N) - 1))];
    }

    std::string email();
    std::string ip();
    std::string ipv6();
    std::string credit_card();
    std::string ssn();
    std::string phone();
    std::string api_key();
    std::string token();
    std::string timestamp();

    std::mt19937 gen_;
};

// Write line_count generated lines to path.
// Returns the number of lines written; throws io_error on failure.
std::size_t generate(const std::string& path, std::size_t line_count, uint32_t seed = 42);

} // namespace sample_logs
} // namespace linescrub
