#include "sample_logs.hpp"
#include "sink_writer.hpp"
#include <cstdio>

namespace linescrub {
namespace sample_logs {

static const char* const first_names[] = {"john", "jane", "bob", "alice", "charlie", "diana", "eve", "frank", "grace", "henry"};
static const char* const last_names[] = {"smith", "johnson", "williams", "brown", "jones", "garcia", "miller", "davis"};
static const char* const domains[] = {"gmail.com", "yahoo.com", "company.com", "example.org", "test.net", "acme.io"};
static const char* const services[] = {"AuthService", "UserService", "PaymentService", "DatabaseService", "CacheService", "APIGateway"};
static const char* const error_types[] = {"NullPointerException", "TimeoutError", "ValidationError", "DatabaseError", "NetworkError"};
static const char alphanum[] = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

LogGenerator::LogGenerator(uint32_t seed) : gen_(seed) {}

int LogGenerator::randint(int lo, int hi) {
    std::uniform_int_distribution<> dis(lo, hi);
    return dis(gen_);
}

std::string LogGenerator::email() {
    return std::string(choice(first_names)) + "." + choice(last_names) +
           std::to_string(randint(0, 999)) + "@" + choice(domains);
}

std::string LogGenerator::ip() {
    return std::to_string(randint(1, 255)) + "." + std::to_string(randint(0, 255)) + "." +
           std::to_string(randint(0, 255)) + "." + std::to_string(randint(1, 255));
}

std::string LogGenerator::ipv6() {
    std::string result;
    char buf[8];
    for (int i = 0; i < 8; i++) {
        if (i > 0) result += ":";
        std::snprintf(buf, sizeof(buf), "%04x", randint(0, 65535));
        result += buf;
    }
    return result;
}

std::string LogGenerator::credit_card() {
    return std::to_string(randint(1000, 9999)) + "-" + std::to_string(randint(1000, 9999)) + "-" +
           std::to_string(randint(1000, 9999)) + "-" + std::to_string(randint(1000, 9999));
}

std::string LogGenerator::ssn() {
    return std::to_string(randint(100, 999)) + "-" + std::to_string(randint(10, 99)) + "-" +
           std::to_string(randint(1000, 9999));
}

std::string LogGenerator::phone() {
    return "+1-" + std::to_string(randint(200, 999)) + "-" + std::to_string(randint(200, 999)) + "-" +
           std::to_string(randint(1000, 9999));
}

std::string LogGenerator::api_key() {
    static const int lengths[] = {32, 40, 64};
    int len = choice(lengths);
    std::string key;
    for (int i = 0; i < len; i++) {
        key += alphanum[randint(0, static_cast<int>(sizeof(alphanum)) - 2)];
    }
    return key;
}

std::string LogGenerator::token() {
    static const char token_chars[] = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789-._";
    int len = randint(30, 50);
    std::string t = "Bearer ";
    for (int i = 0; i < len; i++) {
        t += token_chars[randint(0, static_cast<int>(sizeof(token_chars)) - 2)];
    }
    return t;
}

std::string LogGenerator::timestamp() {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "2024-01-%02d %02d:%02d:%02d",
                  randint(1, 28), randint(0, 23), randint(0, 59), randint(0, 59));
    return buf;
}

std::string LogGenerator::next_line() {
    switch (randint(0, 11)) {
    case 0:
        return ip() + " - - [" + timestamp() + "] \"GET /api/users HTTP/1.1\" 200 " +
               std::to_string(randint(100, 5000)) + " \"" + email() + "\"";
    case 1:
        return "[" + timestamp() + "] INFO: User " + email() + " logged in from " + ip();
    case 2:
        return "[" + timestamp() + "] WARN: Failed login attempt for " + email() + " from " + ip();
    case 3:
        return timestamp() + " PaymentService: Processing payment for card " + credit_card() +
               " amount=$" + std::to_string(randint(10, 5000));
    case 4:
        return "[" + timestamp() + "] API Request: POST /api/v1/users auth=" + token() + " ip=" + ip();
    case 5:
        return timestamp() + " UserService: New registration email=" + email() + " phone=" + phone() +
               " ip=" + ip();
    case 6:
        return "[" + timestamp() + "] ERROR: " + choice(error_types) + " in " + choice(services) +
               " for user " + email();
    case 7:
        return timestamp() + " " + choice(services) + " -> " + choice(services) + ": Request from " + ip() +
               " token=" + api_key();
    case 8:
        return "[" + timestamp() + "] KYC: Verification requested ssn=" + ssn() + " email=" + email() +
               " ip=" + ip();
    case 9:
        return "{\"timestamp\": \"" + timestamp() + "\", \"level\": \"INFO\", \"user\": \"" + email() +
               "\", \"ip\": \"" + ip() + "\"}";
    case 10:
        return "[" + timestamp() + "] IPv6: Connection from " + ipv6() + " user=" + email();
    default:
        return timestamp() + " MFA: Code sent to " + phone() + " for " + email() + " from " + ip();
    }
}

std::size_t generate(const std::string& path, std::size_t line_count, uint32_t seed) {
    LogGenerator generator(seed);
    SinkWriter writer(path);
    for (std::size_t i = 0; i < line_count; i++) {
        writer.write_line(generator.next_line());
    }
    writer.finish();
    return line_count;
}

} // namespace sample_logs
} // namespace linescrub
