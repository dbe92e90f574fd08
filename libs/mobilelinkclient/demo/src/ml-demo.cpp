/*
 * Copyright (c) 2017 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Demo app for connecting to Generac MobileLink
 *
 */

#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iostream>
#include <map>
#include <string>
#include "demo-defaults.hpp"
#include "common/Logger.hpp"
#include "connection/RESTClient.hpp"
#include "mobilelinkclient/API.hpp"
#include "mobilelinkclient/mobilelinkclient.hpp"
#include "time/IsoTimeString.hpp"


using namespace std;


std::string configfile;

bool verbose;

std::string ERROR = "ERROR: ";
std::string WARN = "WARNING: ";


void usage(std::string command)
{
	cout << "MobileLink demo client\n";
	cout << "Usage: " << command << " [-v] [-c file]\n";
	cout << "\n";
	cout << "  -h, --help                display this help and exit\n";
	cout << "  -v, --verbose             show debug output\n";
	cout << "  -c, --conf=FILE           use values from FILE in stead of " << CONF_FILE << "\n";
	cout << "\n";
	exit(0);
}


void exit_error(std::string message)
{
	cerr << message << endl;
	exit(1);
}


void parse_args(int argc, char** argv)
{
	int i = 1;
	std::string word;
	while (i < argc)
	{
		word = argv[i];
		if (word.length() > 1 && word[0] == '-' && word[1] != '-')
		{
			for (size_t j = 1; j < word.length(); j++)
			{
				if (word[j] == 'h')
					usage("ml-demo");
				else if (word[j] == 'v')
					verbose = true;
				else if (word[j] == 'c')
				{
					if (j + 1 < word.length())
						exit_error(ERROR+"option '-c' cannot be combined with other options");
					i++;
					if (i >= argc)
						exit_error(ERROR+"option '-c' requires a file name");
					configfile = argv[i];
				}
				else
				{
					usage("ml-demo");
				}
			}
		}
		else if (word == "--help")
			usage("ml-demo");
		else if (word == "--verbose")
			verbose = true;
		else if (word.substr(0, 7) == "--conf=")
			configfile = word.substr(7);
		else
			usage("ml-demo");
		i++;
	}
}


/*
 * Pick the credential from the config, strongest first
 */
mobilelink::auth::credential get_credential()
{
	if (!mlconfig["token"].empty())
		return mobilelink::auth::token(mlconfig["token"]);
	if (!mlconfig["cookies"].empty())
		return mobilelink::auth::cookies(mlconfig["cookies"], mlconfig["usr"], mlconfig["pw"]);
	if (mlconfig["usr"].empty() || mlconfig["pw"].empty())
		exit_error(ERROR+"no token, cookies or usr/pw specified in "+configfile);
	return mobilelink::auth::username_password(mlconfig["usr"], mlconfig["pw"]);
}


std::string format_timestamp(const std::string &szTimestamp)
{
	if (szTimestamp.empty())
		return "<null>";
	time_t tUTC;
	std::string szError;
	if (!IsoTimeString::parse_timestamp(szTimestamp, tUTC, szError))
	{
		cerr << WARN << szError << endl;
		return szTimestamp;
	}
	return IsoTimeString::utc_to_local(tUTC);
}


int main(int argc, char** argv)
{
	configfile = CONF_FILE;
	parse_args(argc, argv);

// get settings from config file
	if (!read_mlconfig(configfile))
		exit_error(ERROR+"can't read config file '"+configfile+"'");

	if (verbose || (mlconfig["debug"] == "true") || (mlconfig["debug"] == "1"))
		_log.SetDebugFlags(DEBUG_ALL);

	if (!mlconfig["cookiefile"].empty())
		RESTClient::SetCookieFile(mlconfig["cookiefile"]);
	else
		RESTClient::SetCookieFile(COOKIE_FILE);
	if (!mlconfig["timeout"].empty())
		RESTClient::SetTimeout(atol(mlconfig["timeout"].c_str()));

	mobilelink::auth::credential credential = get_credential();

// connect to MobileLink server
	std::cout << "connect to MobileLink server (" << mobilelink::auth::method::name[credential.eMethod] << ")\n";
	MobileLinkClient *mlclient;
	mlclient = new MobileLinkClient(credential);
	mlclient->set_empty_field_response("<null>");

// retrieve generators
	std::cout << "retrieve generator data\n";
	mobilelink::result::value res = mlclient->fetch_device_data();
	if (res == mobilelink::result::NO_DATA)
		std::cout << "    no apparatuses found for this account\n";
	else if (res != mobilelink::result::OK)
	{
		std::cout << "    failed: " << mobilelink::result::name[res] << ": " << mlclient->get_last_error() << "\n";
		mlclient->cleanup();
		delete mlclient;
		exit(1);
	}

// start demo output
	std::cout << "\nGenerators:\n";
	std::cout << "      ID       status        hours     battery   last seen              name\n";
	std::map<std::string, mobilelink::device::item>::iterator it;
	for (it = mlclient->m_mItems.begin(); it != mlclient->m_mItems.end(); ++it)
	{
		mobilelink::device::item *item = &it->second;
		std::cout << "    " << it->first;
		std::cout << " => " << (item->detail.szStatusLabel.empty() ? "<null>" : item->detail.szStatusLabel);
		std::cout << " => " << mlclient->get_property_value(item, mobilelink::property::engineHours);
		std::cout << " => " << mlclient->get_property_value(item, mobilelink::property::batteryVoltage);
		std::cout << " => " << format_timestamp(item->detail.szLastSeen);
		std::cout << " => " << item->apparatus.szName;
		std::cout << "\n";
	}

	std::cout << "\n";

/*
	std::cout << "\nDump of apparatus detail\n";
	for (it = mlclient->m_mItems.begin(); it != mlclient->m_mItems.end(); ++it)
		std::cout << it->second.detail.jDetail.toStyledString() << "\n";
*/

	mlclient->cleanup();
	delete mlclient;

	return 0;
}
