#include "Log.hpp"

#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/basic_file_sink.h"

#define TETHER_LibName "Tether"
#define TETHER_AppName "App"

namespace Tether
{
	std::shared_ptr<spdlog::logger> CLog::S_TetherLogger;
	std::shared_ptr<spdlog::logger> CLog::S_AppLogger;

	void CLog::Init(const std::string& file_path)
	{
		spdlog::set_pattern( "[%H:%M:%S %z] [%n] [%^---%L---%$] [thread %t] %v" );
		auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();

		S_TetherLogger = std::make_shared<spdlog::logger>( TETHER_LibName, spdlog::sinks_init_list { console_sink } );
		S_TetherLogger->set_level( spdlog::level::trace );

		// initialize the host application logger
		S_AppLogger = std::make_shared<spdlog::logger>( TETHER_AppName, spdlog::sinks_init_list { console_sink } );
		S_AppLogger->set_level( spdlog::level::trace );

		// make it output to file
		if (!file_path.empty())
		{
			try
			{
				auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>( file_path, true );
				S_TetherLogger->sinks().push_back( file_sink );
				S_AppLogger->sinks().push_back( file_sink );
			}
			catch (const spdlog::spdlog_ex& ex)
			{
				S_TetherLogger->warn( "Could not open log file {}: {}", file_path, ex.what() );
			}
		}
	}

	void CLog::Shutdown()
	{
		if (S_TetherLogger)
			LOG_TETHER_TRACE( "Destroying Log" );

		spdlog::drop_all();

		// shutdown all loggers
		spdlog::shutdown();
		S_TetherLogger.reset();
		S_AppLogger.reset();
	}

	void CLog::SetLevel(spdlog::level::level_enum level)
	{
		GetTetherLogger()->set_level( level );
		GetAppLogger()->set_level( level );
	}
}
