/**
 * @file Runner.hpp
 * @brief One idempotent run: load, edit, persist, report
 */

#ifndef YEDIT_RUNNER_HPP
#define YEDIT_RUNNER_HPP

#include "yedit/Value.hpp"
#include "yedit/Params.hpp"

namespace yedit {

/**
 * @brief Execute a run described by validated parameters
 *
 * - list: report the value at `key` (the whole document for an empty key)
 * - absent: remove `key` (or pop `value` from it with `update`)
 * - present: replace with `content`, then apply the single edit or the
 *   edit batch, writing `src` when something changed
 *
 * @return {"changed", "result", "state"} on success (plus "dropped_keys"
 *         when YAML keys were dropped while loading), or
 *         {"failed": true, "msg"} when the run failed
 */
Value run(const ModuleParams& params);

} // namespace yedit

#endif // YEDIT_RUNNER_HPP
