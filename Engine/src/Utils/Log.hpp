#pragma once

#include <memory>
#include <string>
#include "spdlog/spdlog.h"

namespace Tether
{
	class CLog
	{
	public:
		// Creates the "Tether" and "App" loggers. An empty file_path disables the file sink.
		static void Init(const std::string& file_path = "");
		static void Shutdown();

		static void SetLevel(spdlog::level::level_enum level);

		static std::shared_ptr<spdlog::logger>& GetTetherLogger()
		{
			if (!S_TetherLogger)
				Init();
			return S_TetherLogger;
		}

		static std::shared_ptr<spdlog::logger>& GetAppLogger()
		{
			if (!S_AppLogger)
				Init();
			return S_AppLogger;
		}

	private:
		static std::shared_ptr<spdlog::logger> S_TetherLogger;
		static std::shared_ptr<spdlog::logger> S_AppLogger;
	};
}

// Library log macros
#define LOG_TETHER_TRACE(...) ::Tether::CLog::GetTetherLogger()->trace(__VA_ARGS__)
#define LOG_TETHER_INFO(...)  ::Tether::CLog::GetTetherLogger()->info(__VA_ARGS__)
#define LOG_TETHER_WARN(...)  ::Tether::CLog::GetTetherLogger()->warn(__VA_ARGS__)
#define LOG_TETHER_ERROR(...) ::Tether::CLog::GetTetherLogger()->error(__VA_ARGS__)
#define LOG_TETHER_FATAL(...) ::Tether::CLog::GetTetherLogger()->critical(__VA_ARGS__)

// Host application log macros
#define LOG_APP_TRACE(...) ::Tether::CLog::GetAppLogger()->trace(__VA_ARGS__)
#define LOG_APP_INFO(...)  ::Tether::CLog::GetAppLogger()->info(__VA_ARGS__)
#define LOG_APP_WARN(...)  ::Tether::CLog::GetAppLogger()->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...) ::Tether::CLog::GetAppLogger()->error(__VA_ARGS__)
#define LOG_APP_FATAL(...) ::Tether::CLog::GetAppLogger()->critical(__VA_ARGS__)
