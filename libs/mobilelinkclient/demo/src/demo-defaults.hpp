/*
 * Copyright (c) 2018 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Defaults and config reader for the MobileLink demo app
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */


#ifndef MYPATH
#define MYPATH "/"
#endif

#ifndef CONF_FILE
#define CONF_FILE "mlconfig"
#endif

#ifndef COOKIE_FILE
#define COOKIE_FILE "/tmp/mobilelink_cookies.txt"
#endif


#include <fstream>
#include <sstream>
#include <map>


std::map<std::string,std::string> mlconfig;


/*
 * key = value lines. Only the first unquoted '=' separates key from value,
 * so quoted cookie strings may contain both '=' and spaces.
 */
bool read_mlconfig(std::string configfile = CONF_FILE)
{
	std::ifstream myfile (configfile.c_str());
	if ( myfile.is_open() )
	{
		std::stringstream key,val;
		bool isKey = true;
		bool quoted = false;
		std::string line;
		unsigned int i;
		while ( getline(myfile,line) )
		{
			if ( line.empty() || (line[0] == '#') || (line[0] == ';') )
				continue;
			quoted = false;
			for (i = 0; i < line.length(); i++)
			{
				if ( (line[i] == '\'') || (line[i] == '"') )
				{
					quoted = ( ! quoted );
					continue;
				}
				if (line[i] == 0x0d)
					continue;
				if ( (line[i] == ' ') && ( ! quoted ) )
					continue;
				if ( (line[i] == '=') && isKey && ( ! quoted ) )
				{
					isKey = false;
					continue;
				}
				if (isKey)
					key << line[i];
				else
					val << line[i];
			}
			if ( ! isKey )
			{
				std::string skey = key.str();
				mlconfig[skey] = val.str();
			}
			isKey = true;
			key.str("");
			val.str("");
		}
		myfile.close();
		return true;
	}
	return false;
}

