/*
 * Copyright (c) 2020 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Simple printf style logger
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include "Logger.hpp"
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <vector>


#ifdef _WIN32
#define localtime_r(timep, result) localtime_s(result, timep)
#endif


CLogger _log;


CLogger::CLogger() :
	m_log_flags(LOG_NORM | LOG_STATUS | LOG_ERROR),
	m_debug_flags(0)
{
}


CLogger::~CLogger()
{
	if (m_outputfile.is_open())
		m_outputfile.close();
}


void CLogger::SetLogFlags(const uint32_t iFlags)
{
	std::unique_lock<std::mutex> lock(m_mutex);
	m_log_flags = iFlags;
}


void CLogger::SetDebugFlags(const uint32_t iFlags)
{
	std::unique_lock<std::mutex> lock(m_mutex);
	m_debug_flags = iFlags;
	if (m_debug_flags != 0)
		m_log_flags |= LOG_DEBUG_INT;
	else
		m_log_flags &= ~LOG_DEBUG_INT;
}


bool CLogger::IsLogLevelEnabled(const _eLogLevel level)
{
	std::unique_lock<std::mutex> lock(m_mutex);
	return ((m_log_flags & level) != 0);
}


bool CLogger::IsDebugLevelEnabled(const _eDebugLevel level)
{
	std::unique_lock<std::mutex> lock(m_mutex);
	if (!(m_log_flags & LOG_DEBUG_INT))
		return false;
	return ((m_debug_flags & level) != 0);
}


/*
 * Append all log output to a file as well. An empty name closes the file.
 */
bool CLogger::SetOutputFile(const std::string &szFilename)
{
	std::unique_lock<std::mutex> lock(m_mutex);
	if (m_outputfile.is_open())
		m_outputfile.close();
	if (szFilename.empty())
		return true;
	m_outputfile.open(szFilename.c_str(), std::ios::out | std::ios::app);
	return m_outputfile.is_open();
}


void CLogger::Log(const _eLogLevel level, const char *logline, ...)
{
	if (!IsLogLevelEnabled(level))
		return;

	va_list argList;
	va_start(argList, logline);
	std::vector<char> cbuffer(1024);
	int len = vsnprintf(cbuffer.data(), cbuffer.size(), logline, argList);
	va_end(argList);
	if (len < 0)
		return;
	if (static_cast<size_t>(len) >= cbuffer.size())
	{
		cbuffer.resize(len + 1);
		va_start(argList, logline);
		vsnprintf(cbuffer.data(), cbuffer.size(), logline, argList);
		va_end(argList);
	}
	Write(level, std::string(cbuffer.data()));
}


void CLogger::Debug(const _eDebugLevel level, const char *logline, ...)
{
	if (!IsDebugLevelEnabled(level))
		return;

	va_list argList;
	va_start(argList, logline);
	std::vector<char> cbuffer(1024);
	int len = vsnprintf(cbuffer.data(), cbuffer.size(), logline, argList);
	va_end(argList);
	if (len < 0)
		return;
	if (static_cast<size_t>(len) >= cbuffer.size())
	{
		cbuffer.resize(len + 1);
		va_start(argList, logline);
		vsnprintf(cbuffer.data(), cbuffer.size(), logline, argList);
		va_end(argList);
	}
	Write(LOG_DEBUG_INT, std::string(cbuffer.data()));
}


/* private */ void CLogger::Write(const _eLogLevel level, const std::string &szMessage)
{
	time_t now = time(nullptr);
	struct tm ltime;
	localtime_r(&now, &ltime);
	char szDate[32];
	strftime(szDate, sizeof(szDate), "%Y-%m-%d %H:%M:%S", &ltime);

	std::string szLine = szDate;
	switch (level)
	{
	case LOG_ERROR:
		szLine.append("  Error: ");
		break;
	case LOG_STATUS:
		szLine.append("  Status: ");
		break;
	case LOG_DEBUG_INT:
		szLine.append("  Debug: ");
		break;
	default:
		szLine.append("  ");
		break;
	}
	szLine.append(szMessage);

	std::unique_lock<std::mutex> lock(m_mutex);
	if (level == LOG_ERROR)
		std::cerr << szLine << std::endl;
	else
		std::cout << szLine << std::endl;
	if (m_outputfile.is_open())
		m_outputfile << szLine << std::endl;
}

