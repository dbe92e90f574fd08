/*
 * Copyright (c) 2020 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Jsoncpp bridge for MobileLink
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#pragma once
#ifndef _MobileLinkJsonBridge
#define _MobileLinkJsonBridge

#include <memory>
#include <string>
#include <json/json.h>


namespace mobilelink {


/*
 * returns 0 on success, -1 if szInput is not a valid json document
 */
static inline int parse_json_string(const std::string &szInput, Json::Value &jOutput)
{
	jOutput = Json::Value();
	if (szInput.empty())
		return -1;

	Json::CharReaderBuilder jBuilder;
	std::unique_ptr<Json::CharReader> jReader(jBuilder.newCharReader());
	if (!jReader->parse(szInput.c_str(), szInput.c_str() + szInput.size(), &jOutput, nullptr))
		return -1;
	return 0;
}


/*
 * string value of a scalar member, szDefault if absent or not a scalar
 */
static inline std::string get_json_string(const Json::Value &jObject, const char *szKey, const std::string &szDefault = "")
{
	if (!jObject.isObject() || !jObject.isMember(szKey))
		return szDefault;
	const Json::Value &jValue = jObject[szKey];
	if (jValue.isString() || jValue.isNumeric() || jValue.isBool())
		return jValue.asString();
	return szDefault;
}

}; // namespace mobilelink

#endif
