/*
 * Copyright (c) 2016-2020 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Json client for Generac MobileLink API
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#pragma once
#include <string>
#include <vector>

#define MOBILELINK_API_HOST "https://app.mobilelinkgen.com/api"
#define MOBILELINK_LOGIN_HOST "https://generacconnectivity.b2clogin.com/generacconnectivity.onmicrosoft.com/B2C_1A_MobileLink_SignIn"


namespace mobilelink {

  namespace API {

    namespace header {
      static const std::string host = "app.mobilelinkgen.com";
      static const std::string appUserAgent = "mobilelink/75633 CFNetwork/3826.600.41 Darwin/24.6.0";
      static const std::string browserUserAgent = "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/122.0.0.0 Safari/537.36";
      static const std::string jsonAccept = "application/json";
      static const std::string browserAccept = "application/json, text/plain, */*";
      static const std::string language = "en-US,en;q=0.9";
      static const std::string csrf = "X-Csrf-Token";
    }; // namespace header

    namespace uri {
      static const std::string base = MOBILELINK_API_HOST;

      static const std::string apparatusList = "/v5/Apparatus/list";
      static const std::string apparatusListV2 = "/v2/Apparatus/list";
      static const std::string apparatusDetail = "/v5/Apparatus/{id}";
      static const std::string apparatusDetailV1 = "/v1/Apparatus/details/{id}";

      static std::string get_path(const std::string &szApiFunction, const std::string &szId = "")
      {
        std::string result = szApiFunction;
        size_t pos = result.find("{id}");
        if (pos != std::string::npos)
          result.replace(pos, 4, szId);
        return result;
      }

    }; // namespace uri

    namespace signin {
      static const std::string loginBase = MOBILELINK_LOGIN_HOST;
      static const std::string policy = "B2C_1A_SignUpOrSigninOnline";
      static const std::string start = MOBILELINK_API_HOST"/Auth/SignIn?email=";
      static const std::string selfAsserted = MOBILELINK_LOGIN_HOST"/SelfAsserted";
      static const std::string confirmed = MOBILELINK_LOGIN_HOST"/api/CombinedSigninAndSignup/confirmed";
      static const std::string transactionPrefix = "StateProperties=";
      static const std::string settingsPrefix = "var SETTINGS = ";
    }; // namespace signin

  }; // namespace API


  /*
   * property type codes, newest API generation first
   */
  namespace property {
    static const std::vector<int> engineHours = {71, 70};
    static const std::vector<int> hoursOfProtection = {32, 31};
    static const std::vector<int> batteryVoltage = {70, 69};
    static const std::vector<int> exerciseMinutes = {95};
    static const std::vector<int> fuelType = {88};
  }; // namespace property

}; // namespace mobilelink

