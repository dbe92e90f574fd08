/*
 * Copyright (c) 2020 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Type definitions for devices in MobileLink API
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include "devices.hpp"
#include "jsoncppbridge.hpp"


namespace mobilelink {
  namespace device {


bool parse_apparatus(const Json::Value &jApparatus, mobilelink::device::apparatus &apparatus)
{
	if (!jApparatus.isObject())
		return false;
	if (!jApparatus["apparatusId"].isInt64() || !jApparatus["type"].isInt())
		return false;

	apparatus.apparatusId = jApparatus["apparatusId"].asInt64();
	apparatus.type = jApparatus["type"].asInt();
	apparatus.szName = get_json_string(jApparatus, "name");
	apparatus.szSerialNumber = get_json_string(jApparatus, "serialNumber");
	apparatus.szModelNumber = get_json_string(jApparatus, "modelNumber");
	apparatus.szLocalizedAddress = get_json_string(jApparatus, "localizedAddress");
	apparatus.szPreferredDealerName = get_json_string(jApparatus, "preferredDealerName");
	apparatus.szPreferredDealerEmail = get_json_string(jApparatus, "preferredDealerEmail");
	apparatus.szPreferredDealerPhone = get_json_string(jApparatus, "preferredDealerPhone");
	apparatus.szPanelId = get_json_string(jApparatus, "panelId");
	apparatus.jApparatus = jApparatus;
	return true;
}


bool parse_apparatus_detail(const Json::Value &jDetail, mobilelink::device::apparatusDetail &detail)
{
	if (!jDetail.isObject())
		return false;

	detail.bHasApparatusStatus = jDetail["apparatusStatus"].isInt();
	detail.apparatusStatus = detail.bHasApparatusStatus ? jDetail["apparatusStatus"].asInt() : 0;
	detail.szDeviceType = get_json_string(jDetail, "deviceType");
	detail.szDeviceSsid = get_json_string(jDetail, "deviceSsid");
	detail.szStatusLabel = get_json_string(jDetail, "statusLabel");
	detail.szStatusText = get_json_string(jDetail, "statusText");
	detail.szActivationDate = get_json_string(jDetail, "activationDate");
	detail.szLastSeen = get_json_string(jDetail, "lastSeen");
	detail.szConnectionTimestamp = get_json_string(jDetail, "connectionTimestamp");
	detail.szNetworkType = get_json_string(jDetail, "networkType");
	detail.szCurrentAlarm = get_json_string(jDetail, "currentAlarm");

	std::vector<mobilelink::device::property>().swap(detail.properties);
	const Json::Value &jProperties = jDetail["properties"];
	if (!jProperties.isNull())
	{
		if (!jProperties.isArray())
			return false;
		for (Json::ArrayIndex i = 0; i < jProperties.size(); ++i)
		{
			if (!jProperties[i].isObject() || !jProperties[i]["type"].isInt())
				return false;
			mobilelink::device::property newprop = mobilelink::device::property();
			newprop.type = jProperties[i]["type"].asInt();
			newprop.jValue = jProperties[i]["value"];
			detail.properties.push_back(newprop);
		}
	}

	detail.bHasWeather = false;
	detail.weatherTemperature = mobilelink::device::temperature();
	detail.weatherTemperature.bHasValue = false;
	const Json::Value &jWeather = jDetail["weather"];
	if (jWeather.isObject())
	{
		detail.bHasWeather = true;
		const Json::Value &jTemperature = jWeather["temperature"];
		if (jTemperature.isObject() && jTemperature["value"].isNumeric())
		{
			detail.weatherTemperature.bHasValue = true;
			detail.weatherTemperature.value = jTemperature["value"].asDouble();
			detail.weatherTemperature.szUnit = get_json_string(jTemperature, "unit");
		}
	}

	detail.jDetail = jDetail;
	return true;
}

  }; // namespace device
}; // namespace mobilelink

