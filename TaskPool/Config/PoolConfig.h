#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include "../Utils/Log.h"

namespace taskpool {

	struct PoolConfig {
		size_t max_at_once{ 4 };
		log::Level console_level{ log::Level::Warn };
		log::Level file_level{ log::Level::Off };
		std::filesystem::path log_file;   // empty: no file sink
		bool log_colors{ true };
	};

	// INI-style config:
	//   [runner]
	//   max_at_once = 8
	//   [log]
	//   level = info          console sink (stderr)
	//   file_level = debug
	//   file = taskpool.log   relative to the ini
	//   colors = true
	// Unknown sections and keys are ignored so other tools can share the file.
	namespace PoolConfigIO {

		// $HOME/.config/TaskPool/taskpool.ini, or the working directory without HOME
		std::filesystem::path DefaultConfigPath();

		// Returns std::nullopt on IO or value errors and sets error_out (optional).
		std::optional<PoolConfig> Load(const std::filesystem::path& path, std::string* error_out = nullptr);

		// Creates parent dirs as needed. Returns false on error.
		bool Save(const PoolConfig& cfg, const std::filesystem::path& path, std::string* error_out = nullptr);

		// TASKPOOL_MAX_AT_ONCE and TASKPOOL_LOG_LEVEL win over the file.
		// Invalid values are left alone and reported through error_out.
		bool ApplyEnvOverrides(PoolConfig& cfg, std::string* error_out = nullptr);

		// Utility: trim spaces and surrounding quotes from a string (exposed for tests)
		std::string TrimAndUnquote(std::string s);

		// "true/yes/on/1", "false/no/off/0"
		std::optional<bool> ParseBool(const std::string& s);

	} // namespace PoolConfigIO

	// Pushes the log settings into the process logger.
	void apply_logging(const PoolConfig& cfg);

} // namespace taskpool
