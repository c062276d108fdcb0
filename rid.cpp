#include "rid.h"
#include <random>
#include <stdexcept>
#include <fmt/format.h>

#include "hmac.h"
#include "logger.h"

std::string RID::NewIdentifier(std::size_t n) {
    return DefaultStream().Generate(n);
}

std::string RID::NewIdentifierMath(std::size_t n) {
    thread_local std::mt19937 gen {std::random_device {}()};
    std::uniform_int_distribution<std::size_t> dist(0, B62Size - 1);
    std::string res(n, '\0');
    for (auto &c : res)
        c = B62Alphabet[dist(gen)];
    return res;
}

std::string RID::Sign(const std::string &message, const std::string &secret) {
    return UsingOpenSSL::hmac_sha256(message, secret, SignatureBytes);
}

std::string RID::NewSignedIdentifier20(const std::string &secret) {
    auto r = NewIdentifier20();
    return r + Sign(r, secret);
}

bool RID::ValidateIdentifier(const std::string &s, std::size_t expectedLen) {
    return s.size() == expectedLen && IsB62(s);
}

bool RID::ValidateSignedIdentifier20(const std::string &s, const std::string &secret) {
    if (s.size() != SignedIdentifierLength)
        return false;
    auto rid = s.substr(0, IdentifierLength20);
    auto hexed = s.substr(IdentifierLength20);
    if (!ValidateIdentifier20(rid))
        return false;
    try {
        return UsingOpenSSL::constant_time_equal(hexed, Sign(rid, secret));
    } catch (const std::runtime_error &e) {
        ShowLogCritical(fmt::format("RID: signature check could not run: {}", e.what()));
        return false;
    }
}

std::string RID::NewNumericId() {
    return fmt::format("{}", NewInt63Crypto() % NumericIdModulus);
}

std::string RID::FormatDashedNumericId(const std::string &nid) {
    if (nid.size() < 6)
        throw std::invalid_argument(fmt::format("numeric id too short to dash: \"{}\"", nid));
    return fmt::format("{}-{}-{}", nid.substr(0, 3), nid.substr(3, 3), nid.substr(6));
}
