#include "config.hpp"

#include <functional>
#include <limits>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace protocol {

namespace {

uint64_t parse_u64(const std::string& key, const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw ValidationError("config: " + key + " is not an unsigned integer: '" + value + "'");
    }
    try {
        return std::stoull(value);
    } catch (const std::out_of_range&) {
        throw ValidationError("config: " + key + " is out of range");
    }
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

// Key table shared by the reader and the writer
struct Field {
    const char* key;
    std::function<uint64_t(const PlatformConfig&)> get;
    std::function<void(PlatformConfig&, uint64_t)> set;
};

template <typename T>
Field field(const char* key, T PlatformConfig::*member) {
    return Field{
        key,
        [member](const PlatformConfig& c) { return static_cast<uint64_t>(c.*member); },
        [key, member](PlatformConfig& c, uint64_t v) {
            if (v > std::numeric_limits<T>::max()) {
                throw ValidationError(std::string("config: ") + key + " is out of range");
            }
            c.*member = static_cast<T>(v);
        }
    };
}

const std::vector<Field>& fields() {
    static const std::vector<Field> table = {
        field("MIN_DURATION",        &PlatformConfig::min_duration),
        field("MAX_DURATION",        &PlatformConfig::max_duration),
        field("GRACE_PERIOD",        &PlatformConfig::grace_period),
        field("REVEAL_TIMEOUT",      &PlatformConfig::reveal_timeout),
        field("MAX_RETRIES",         &PlatformConfig::max_retries),
        field("MAX_TARGET",          &PlatformConfig::max_target),
        field("MAX_CONTRIBUTION",    &PlatformConfig::max_contribution),
        field("MAX_RAISED",          &PlatformConfig::max_raised),
        field("MULTIPLIER_MIN",      &PlatformConfig::multiplier_min),
        field("MULTIPLIER_MAX",      &PlatformConfig::multiplier_max),
        field("MAX_TITLE_LEN",       &PlatformConfig::max_title_len),
        field("MAX_DESCRIPTION_LEN", &PlatformConfig::max_description_len),
        field("MAX_CATEGORY_LEN",    &PlatformConfig::max_category_len),
        field("MAX_CONTENT_REF_LEN", &PlatformConfig::max_content_ref_len),
        field("MAX_MESSAGE_LEN",     &PlatformConfig::max_message_len),
    };
    return table;
}

} // namespace

void PlatformConfig::validate() const {
    if (min_duration == 0 || min_duration > max_duration) {
        throw ValidationError("config: MIN_DURATION must be positive and not exceed MAX_DURATION");
    }
    if (reveal_timeout == 0) {
        throw ValidationError("config: REVEAL_TIMEOUT must be positive");
    }
    if (max_duration > MAX_PERIOD || grace_period > MAX_PERIOD || reveal_timeout > MAX_PERIOD) {
        throw ValidationError("config: MAX_DURATION, GRACE_PERIOD and REVEAL_TIMEOUT must not exceed 2^40 seconds");
    }
    if (max_retries == 0) {
        throw ValidationError("config: MAX_RETRIES must be positive");
    }
    if (max_target == 0 || max_contribution == 0) {
        throw ValidationError("config: amount ceilings must be positive");
    }
    if (max_raised < max_target || max_raised < max_contribution) {
        throw ValidationError("config: MAX_RAISED must cover MAX_TARGET and MAX_CONTRIBUTION");
    }
    if (multiplier_min < 2 || multiplier_min >= multiplier_max) {
        throw ValidationError("config: multiplier range must be [min, max) with 2 <= min < max");
    }
    if (max_target > std::numeric_limits<uint64_t>::max() / (multiplier_max - 1)) {
        throw ValidationError("config: MAX_TARGET * (MULTIPLIER_MAX - 1) overflows 64 bits");
    }
}

std::string PlatformConfig::to_env_string() const {
    std::ostringstream oss;
    for (const auto& f : fields()) {
        oss << f.key << "=" << f.get(*this) << "\n";
    }
    return oss.str();
}

PlatformConfig PlatformConfig::from_env_string(const std::string& env_content) {
    std::map<std::string, const Field*> by_key;
    for (const auto& f : fields()) {
        by_key[f.key] = &f;
    }

    PlatformConfig config;
    std::istringstream iss(env_content);
    std::string line;
    while (std::getline(iss, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw ValidationError("config: malformed line '" + line + "'");
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        auto it = by_key.find(key);
        if (it == by_key.end()) {
            throw ValidationError("config: unknown key '" + key + "'");
        }
        it->second->set(config, parse_u64(key, value));
    }

    config.validate();
    return config;
}

} // namespace protocol
