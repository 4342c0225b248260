#include "dcp/ppid.hpp"
#include "dcp/errors.hpp"
#include "dcp/logger.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <cstdio>
#include <sstream>

namespace dcp {
namespace {
std::vector<std::string> split(const std::string& text, char sep) {
    std::vector<std::string> out;
    std::string item;
    std::stringstream ss(text);
    while (std::getline(ss, item, sep)) out.push_back(item);
    return out;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> keys_of(const KwargSpec& spec) {
    std::vector<std::string> keys;
    for (auto& kv : spec) keys.push_back(kv.first);
    return keys;
}
}  // namespace

std::vector<std::string> get_unique_prefix(const std::vector<std::string>& keys) {
    std::vector<std::string> out;
    out.reserve(keys.size());
    for (size_t i = 0; i < keys.size(); ++i) {
        const std::string& key = keys[i];
        std::string abbrev = key;
        for (size_t len = 1; len <= key.size(); ++len) {
            std::string prefix = key.substr(0, len);
            bool clash = false;
            for (size_t j = 0; j < keys.size() && !clash; ++j)
                clash = j != i && starts_with(keys[j], prefix);
            if (!clash) {
                abbrev = prefix;
                break;
            }
        }
        out.push_back(abbrev);
    }
    return out;
}

std::string convert_to_str(const KwargValue& value) {
    if (auto b = std::get_if<bool>(&value)) return *b ? "1" : "0";
    if (auto i = std::get_if<int>(&value)) return std::to_string(*i);
    if (auto d = std::get_if<double>(&value)) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.15g", *d);
        return buf;
    }
    return std::get<std::string>(value);
}

KwargValue convert_from_str(const std::string& text, const KwargValue& like) {
    try {
        size_t used = 0;
        if (std::holds_alternative<bool>(like)) {
            if (text == "1" || text == "true" || text == "True") return true;
            if (text == "0" || text == "false" || text == "False") return false;
            throw ConfigError("not a boolean");
        }
        if (std::holds_alternative<int>(like)) {
            int v = std::stoi(text, &used);
            if (used != text.size()) throw ConfigError("trailing characters");
            return v;
        }
        if (std::holds_alternative<double>(like)) {
            double v = std::stod(text, &used);
            if (used != text.size()) throw ConfigError("trailing characters");
            return v;
        }
    } catch (const std::logic_error&) {
        std::throw_with_nested(ConfigError("Could not convert '" + text + "'"));
    }
    return text;
}

Kwargs defaults_of(const KwargSpec& spec) {
    Kwargs out;
    for (auto& kv : spec) out[kv.first] = kv.second;
    return out;
}

std::string kwargs_to_ppid(const KwargSpec& spec, const Kwargs& kwargs) {
    for (auto& kv : kwargs) {
        bool known = std::any_of(spec.begin(), spec.end(),
                                 [&](const auto& s) { return s.first == kv.first; });
        if (!known) throw ConfigError("Unknown keyword argument '" + kv.first + "'");
    }
    auto abbrevs = get_unique_prefix(keys_of(spec));
    std::string out;
    for (size_t i = 0; i < spec.size(); ++i) {
        auto it = kwargs.find(spec[i].first);
        KwargValue value = it == kwargs.end() ? spec[i].second : it->second;
        if (value.index() != spec[i].second.index()) {
            // int given for a float parameter and the like
            value = convert_from_str(convert_to_str(value), spec[i].second);
        }
        if (!out.empty()) out += "^";
        out += abbrevs[i] + "=" + convert_to_str(value);
    }
    return out;
}

Kwargs ppid_to_kwargs(const KwargSpec& spec, const std::string& ppid) {
    auto keys = keys_of(spec);
    auto abbrevs = get_unique_prefix(keys);
    Kwargs out = defaults_of(spec);
    if (ppid.empty()) return out;

    for (auto& segment : split(ppid, '^')) {
        auto eq = segment.find('=');
        if (eq == std::string::npos || eq == 0 || segment.find('=', eq + 1) != std::string::npos)
            throw ConfigError("Malformed pipeline identifier segment '" + segment + "'");
        std::string var = segment.substr(0, eq);
        std::string val = segment.substr(eq + 1);

        int match = -1;
        for (size_t i = 0; i < abbrevs.size(); ++i)
            if (abbrevs[i] == var) match = static_cast<int>(i);
        if (match < 0) {
            std::vector<int> candidates;
            for (size_t i = 0; i < keys.size(); ++i)
                if (starts_with(keys[i], var)) candidates.push_back(static_cast<int>(i));
            if (candidates.empty())
                throw ConfigError("Unknown key '" + var + "' in pipeline identifier '" + ppid + "'");
            if (candidates.size() > 1) {
                Logger::warn("Ignoring ambiguous key '%s' in pipeline identifier '%s'",
                             var.c_str(), ppid.c_str());
                continue;
            }
            match = candidates.front();
        }
        out[keys[match]] = convert_from_str(val, spec[match].second);
    }
    return out;
}

std::string split_ppid(const std::string& ppid, const std::string& expected_code) {
    auto colon = ppid.find(':');
    std::string code = ppid.substr(0, colon);
    if (code != expected_code)
        throw ConfigError("Could not find method '" + code + "' (expected '" + expected_code + "')");
    return colon == std::string::npos ? std::string() : ppid.substr(colon + 1);
}

std::string compute_pipeline_hash(const std::string& gen_id, const std::string& dat_id,
                                  const std::string& bg_id, const std::string& seg_id,
                                  const std::string& feat_id, const std::string& gate_id) {
    std::string joined = gen_id + "|" + dat_id + "|" + bg_id + "|" + seg_id + "|" + feat_id + "|" + gate_id;
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(joined.data(), joined.size(), digest, &len, EVP_md5(), nullptr) != 1)
        throw std::runtime_error("MD5 digest failed");
    static const char* hex = "0123456789abcdef";
    std::string out;
    for (unsigned int i = 0; i < len; ++i) {
        out += hex[digest[i] >> 4];
        out += hex[digest[i] & 0xf];
    }
    return out;
}
}
