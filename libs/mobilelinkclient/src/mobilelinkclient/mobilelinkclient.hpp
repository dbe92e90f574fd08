/*
 * Copyright (c) 2016-2020 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Json client for Generac MobileLink API
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#ifndef _MobileLinkClient
#define _MobileLinkClient

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <json/json.h>
#include "../common/messages.hpp"
#include "../mobilelink/devices.hpp"
#include "../mobilelink/session.hpp"

class MobileLinkHTTPBridge;


class MobileLinkClient
{
public:
/************************************************************************
 *									*
 *	Main storage							*
 *									*
 *	Generator units by apparatus id. The map is replaced as a	*
 *	whole by every successful fetch_device_data() call.		*
 *									*
 ************************************************************************/

	std::map<std::string, mobilelink::device::item> m_mItems;


/************************************************************************
 *									*
 *	Debug information and errors 					*
 *									*
 ************************************************************************/

	std::string get_last_error();
	std::string get_last_response();


/************************************************************************
 *									*
 *	MobileLink authentication					*
 *									*
 *	Bearer tokens are used as is. Browser cookies are tested with	*
 *	a single request to the apparatus list and replaced by a full	*
 *	sign-in if they were rejected and a username and password were	*
 *	supplied with them. A username and password always run the	*
 *	complete sign-in sequence.					*
 *									*
 *	You normally do not need to call login() yourself, it is done	*
 *	by fetch_device_data() whenever the session requires it.	*
 *									*
 ************************************************************************/

	mobilelink::result::value login();
	bool is_logged_in();
	const mobilelink::session::state &get_session_state();


/************************************************************************
 *									*
 *	MobileLink device retrieval					*
 *									*
 *	fetch_device_data() fills m_mItems with every generator unit	*
 *	of the account. It returns NO_DATA if the account has no	*
 *	apparatus list. If the server rejects the session the login is	*
 *	renewed and the fetch is repeated once; a second rejection is	*
 *	returned as SESSION_EXPIRED.					*
 *									*
 *	Calls must not overlap on the same client instance.		*
 *									*
 ************************************************************************/

	mobilelink::result::value fetch_device_data();


/************************************************************************
 *									*
 *	Return Data Fields						*
 *									*
 ************************************************************************/

	mobilelink::device::item *get_item_by_ID(const std::string szApparatusId);

	std::string get_property_value(const std::string szApparatusId, const std::vector<int> &vTypeCodes);
	std::string get_property_value(const mobilelink::device::item *item, const std::vector<int> &vTypeCodes);


/************************************************************************
 *									*
 *	Class construct							*
 *									*
 ************************************************************************/

	explicit MobileLinkClient(const mobilelink::auth::credential &credential);
	MobileLinkClient(const mobilelink::auth::credential &credential, std::shared_ptr<MobileLinkHTTPBridge> httpBridge);
	~MobileLinkClient();
	void cleanup();


/************************************************************************
 *									*
 *	Config options							*
 *									*
 ************************************************************************/

	void set_empty_field_response(std::string szResponse);


private:
	void init();

	// endpoint fetcher
	mobilelink::result::value get_endpoint(const std::string &szPath, Json::Value &jResponse);

	// data retriever
	mobilelink::result::value get_generator_data(std::map<std::string, mobilelink::device::item> &mItems);
	mobilelink::result::value get_apparatus_list(Json::Value &jApparatusList);
	mobilelink::result::value get_apparatus_detail(const std::string &szApparatusId, Json::Value &jDetail);

	// sign-in flow
	mobilelink::result::value sign_in();
	mobilelink::result::value submit_self_asserted(const std::string &szTransId);
	mobilelink::result::value confirm_sign_in(const std::string &szTransId);
	mobilelink::result::value submit_final_form(const std::string &szPage, bool &bSubmitted);
	std::string get_transaction_query(const std::string &szTransId);

	void invalidate_session();
	void set_transport_error(const std::string &szContext);

private:
	const mobilelink::auth::credential m_credential;
	mobilelink::session::state m_session;
	std::shared_ptr<MobileLinkHTTPBridge> m_pHTTP;

	std::string m_szLastError;
	std::string m_szResponse;
	long m_iHTTPCode;

	std::string m_szEmptyFieldResponse;
};

#endif
