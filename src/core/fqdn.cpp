#include "core/fqdn.hpp"

namespace motya {

namespace {

constexpr size_t kMaxNameLength = 253;
constexpr size_t kMaxLabelLength = 63;

bool is_label_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')
        || (c >= '0' && c <= '9') || c == '-';
}

} // anonymous namespace

bool Fqdn::parse(std::string_view text, Fqdn& out, std::string& reason) {
    if (text.empty()) {
        reason = "empty FQDN";
        return false;
    }

    std::string_view body = text;
    if (body.back() == '.') body.remove_suffix(1);
    if (body.size() > kMaxNameLength) {
        reason = "FQDN too long";
        return false;
    }

    size_t label_start = 0;
    for (size_t i = 0; i <= body.size(); ++i) {
        if (i < body.size() && body[i] != '.') {
            if (!is_label_char(body[i])) {
                reason = "invalid char found in FQDN";
                return false;
            }
            continue;
        }

        const auto label = body.substr(label_start, i - label_start);
        if (label.empty()) {
            reason = "empty label in FQDN";
            return false;
        }
        if (label.size() > kMaxLabelLength) {
            reason = "label too long in FQDN";
            return false;
        }
        if (label.front() == '-') {
            reason = "label cannot start with hyphen";
            return false;
        }
        if (label.back() == '-') {
            reason = "label cannot end with hyphen";
            return false;
        }
        label_start = i + 1;
    }

    out.name_ = std::string(text);
    return true;
}

} // namespace motya
