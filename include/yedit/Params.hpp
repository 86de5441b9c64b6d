/**
 * @file Params.hpp
 * @brief Validated run parameters
 *
 * ModuleParams is the typed form of the flat parameter mapping that
 * Config::load() assembles. from_value() checks every field and every
 * cross-field rule, collecting all messages into one ParameterError.
 */

#ifndef YEDIT_PARAMS_HPP
#define YEDIT_PARAMS_HPP

#include "yedit/Value.hpp"
#include "yedit/Codec.hpp"
#include "yedit/Coerce.hpp"
#include "yedit/DotPath.hpp"
#include "yedit/Edit.hpp"
#include <optional>
#include <string>
#include <vector>

namespace yedit {

/**
 * @brief Desired state of a run
 */
enum class State {
    Present,
    Absent,
    List
};

std::string to_string(State state);

/**
 * @brief Parse a state name ("present", "absent", "list")
 * @throws ParameterError for anything else
 */
State parse_state(const std::string& name);

/**
 * @brief Parameters of one run
 */
struct ModuleParams {
    State state = State::Present;
    bool debug = false;
    std::optional<std::string> src;
    std::optional<Value> content;
    ContentType content_type = ContentType::Yaml;
    std::optional<std::string> key = std::string();
    std::optional<Value> value;
    std::string value_type;
    bool update = false;
    bool append = false;
    bool insert = false;
    std::optional<long long> index;
    std::optional<Value> curr_value;
    ValueFormat curr_value_format = ValueFormat::Yaml;
    bool backup = false;
    std::string backup_ext;
    char separator = DEFAULT_SEPARATOR;
    std::optional<std::vector<Edit>> edits;

    /**
     * @brief Validate a parameter mapping
     *
     * Rules:
     * - state, content_type, curr_value_format take their listed names
     * - curr_value and index are mutually exclusive, as are update and append
     * - one of content / src is required
     * - with src, a non-null key or a non-empty edits list whose every
     *   edit has a key is required
     *
     * @param params Flat mapping of parameter name to value
     * @throws ParameterError listing every problem found
     */
    static ModuleParams from_value(const Value& params);

    /**
     * @brief The single edit described by key/value/selectors
     *
     * Only meaningful when `value` is set.
     */
    Edit single_edit() const;
};

} // namespace yedit

#endif // YEDIT_PARAMS_HPP
