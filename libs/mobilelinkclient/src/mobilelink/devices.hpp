/*
 * Copyright (c) 2020 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Type definitions for devices in MobileLink API
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#pragma once
#include <vector>
#include <string>
#include <json/json.h>


namespace mobilelink {
  namespace device {

    namespace type {
      static const int generator = 0;
    }; // namespace type

    typedef struct _sProperty
    {
      int type;
      Json::Value jValue; // string or number
    } property;

    typedef struct _sTemperature
    {
      bool bHasValue;
      double value;
      std::string szUnit;
    } temperature;

    typedef struct _sApparatus
    {
      long long apparatusId;
      int type;
      std::string szName;
      std::string szSerialNumber;
      std::string szModelNumber;
      std::string szLocalizedAddress;
      std::string szPreferredDealerName;
      std::string szPreferredDealerEmail;
      std::string szPreferredDealerPhone;
      std::string szPanelId;
      Json::Value jApparatus;
    } apparatus;

    typedef struct _sApparatusDetail
    {
      bool bHasApparatusStatus;
      int apparatusStatus;
      std::string szDeviceType;
      std::string szDeviceSsid;
      std::string szStatusLabel;
      std::string szStatusText;
      std::string szActivationDate;
      std::string szLastSeen;
      std::string szConnectionTimestamp;
      std::string szNetworkType;
      std::string szCurrentAlarm;
      std::vector<mobilelink::device::property> properties;
      bool bHasWeather;
      mobilelink::device::temperature weatherTemperature;
      Json::Value jDetail;
    } apparatusDetail;

    typedef struct _sItem
    {
      mobilelink::device::apparatus apparatus;
      mobilelink::device::apparatusDetail detail;
    } item;


/*
 * Fill the structs from server json. Both return false if a field the
 * client depends on is missing or of the wrong type.
 */
    bool parse_apparatus(const Json::Value &jApparatus, mobilelink::device::apparatus &apparatus);
    bool parse_apparatus_detail(const Json::Value &jDetail, mobilelink::device::apparatusDetail &detail);

  }; // namespace device

}; // namespace mobilelink

