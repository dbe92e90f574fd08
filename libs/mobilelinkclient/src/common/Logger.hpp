/*
 * Copyright (c) 2020 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Simple printf style logger
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#pragma once
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>


enum _eLogLevel : uint32_t
{
	LOG_NORM = 0x0000001,
	LOG_STATUS = 0x0000002,
	LOG_ERROR = 0x0000004,
	LOG_DEBUG_INT = 0x0000008,
	LOG_ALL = 0xFFFFFFF
};

enum _eDebugLevel : uint32_t
{
	DEBUG_NORM = 0x0000001,
	DEBUG_AUTH = 0x0000002,
	DEBUG_RECEIVED = 0x0000004,
	DEBUG_ALL = 0xFFFFFFF
};


class CLogger
{
public:
	CLogger();
	~CLogger();

	void SetLogFlags(const uint32_t iFlags);
	void SetDebugFlags(const uint32_t iFlags);
	bool IsLogLevelEnabled(const _eLogLevel level);
	bool IsDebugLevelEnabled(const _eDebugLevel level);

	bool SetOutputFile(const std::string &szFilename);

	void Log(const _eLogLevel level, const char *logline, ...)
#ifdef __GNUC__
		__attribute__((format(printf, 3, 4)))
#endif
		;
	void Debug(const _eDebugLevel level, const char *logline, ...)
#ifdef __GNUC__
		__attribute__((format(printf, 3, 4)))
#endif
		;

private:
	void Write(const _eLogLevel level, const std::string &szMessage);

private:
	std::mutex m_mutex;
	uint32_t m_log_flags;
	uint32_t m_debug_flags;
	std::ofstream m_outputfile;
};

extern CLogger _log;

