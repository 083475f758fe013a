/**
 * @file ConfigParsers.hpp
 * @brief TOML parsing and serialization logic.
 *
 * Converts between toml++ tables and the configuration structs. Every parser
 * leaves a field at its current value when the key is absent and clamps
 * numeric values into their supported range.
 *
 * @section Dependencies
 * - toml++
 * - ConfigData
 */

#pragma once
#include <toml++/toml.h>
#include "ConfigData.hpp"

namespace rs {

class ConfigParsers {
public:
    static void parseExport(const toml::table& tbl, ExportConfig& cfg);
    static void parseCapture(const toml::table& tbl, CaptureConfig& cfg);
    static void parseNormalization(const toml::table& tbl,
                                   NormalizationConfig& cfg);

    static toml::table serialize(const ExportConfig& exporting,
                                 const CaptureConfig& capture,
                                 const NormalizationConfig& normalization,
                                 bool debug);
};

} // namespace rs
