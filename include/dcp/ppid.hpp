#pragma once
#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace dcp {
// Pipeline identifiers ("ppid") describe each stage's configuration as
// "code:k1=v1^k2=v2" with keyword names abbreviated to their shortest
// unique prefix. The hash over all stage identifiers fingerprints a run.

constexpr const char* kPipelineGeneration = "7";

using KwargValue = std::variant<bool, int, double, std::string>;
using Kwargs = std::map<std::string, KwargValue>;

// Declared keyword arguments of a stage, in declaration order, with defaults.
using KwargSpec = std::vector<std::pair<std::string, KwargValue>>;

// Shortest prefix of each key that is not a prefix of any other key; a key
// that is itself a prefix of another key is kept whole.
std::vector<std::string> get_unique_prefix(const std::vector<std::string>& keys);

std::string convert_to_str(const KwargValue& value);
KwargValue convert_from_str(const std::string& text, const KwargValue& like);

// Defaults merged with `kwargs`, encoded in declaration order.
std::string kwargs_to_ppid(const KwargSpec& spec, const Kwargs& kwargs);

// Inverse of kwargs_to_ppid: segment order does not matter, omitted keys
// take their defaults. Throws ConfigError on malformed or unknown segments.
Kwargs ppid_to_kwargs(const KwargSpec& spec, const std::string& ppid);

Kwargs defaults_of(const KwargSpec& spec);

// Splits "code:rest" and checks the code; throws ConfigError on mismatch.
std::string split_ppid(const std::string& ppid, const std::string& expected_code);

// Hex MD5 of the '|'-joined stage identifiers.
std::string compute_pipeline_hash(const std::string& gen_id, const std::string& dat_id,
                                  const std::string& bg_id, const std::string& seg_id,
                                  const std::string& feat_id, const std::string& gate_id);

template <typename T>
T kwarg(const Kwargs& kwargs, const std::string& name) {
    return std::get<T>(kwargs.at(name));
}
}
