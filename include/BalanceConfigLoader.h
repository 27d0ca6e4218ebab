#pragma once

#include "BalanceConfig.h"

#include <string>

namespace BalanceControl {

/**
 * @brief Reads and writes BalanceConfig as YAML
 *
 * Every section is optional; missing keys keep the compiled defaults. A
 * present baseline_pose replaces the default pose, joint_ranges entries
 * override or extend the default ranges. The result is validated before it is
 * returned, so callers only ever see a usable configuration.
 */
class BalanceConfigLoader {
public:
    /**
     * @brief Load configuration from a YAML file
     * @throws ConfigurationError on unreadable files, malformed YAML, wrong
     *         types or values that fail validation
     */
    static BalanceConfig load(const std::string& filepath);

    /**
     * @brief Parse configuration from YAML text
     */
    static BalanceConfig parse(const std::string& yamlText);

    /**
     * @brief Write configuration to a YAML file loadable by load()
     * @throws ConfigurationError if the file cannot be written
     */
    static void save(const std::string& filepath, const BalanceConfig& config);

    static std::string emit(const BalanceConfig& config);
};

} // namespace BalanceControl
