/*
 * Copyright (c) 2020 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Scraping of the MobileLink sign-in pages
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include "signinpage.hpp"
#include "../mobilelinkclient/API.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <vector>


namespace mobilelink {
  namespace html {


static bool is_space(const char c)
{
	return ((c == ' ') || (c == '\t') || (c == '\r') || (c == '\n') || (c == '\f'));
}

static std::string to_lower(std::string szText)
{
	std::transform(szText.begin(), szText.end(), szText.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return szText;
}

static void append_utf8(std::string &szOutput, unsigned long codepoint)
{
	if (codepoint < 0x80)
		szOutput.append(1, static_cast<char>(codepoint));
	else if (codepoint < 0x800)
	{
		szOutput.append(1, static_cast<char>(0xC0 | (codepoint >> 6)));
		szOutput.append(1, static_cast<char>(0x80 | (codepoint & 0x3F)));
	}
	else if (codepoint < 0x10000)
	{
		szOutput.append(1, static_cast<char>(0xE0 | (codepoint >> 12)));
		szOutput.append(1, static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
		szOutput.append(1, static_cast<char>(0x80 | (codepoint & 0x3F)));
	}
	else if (codepoint < 0x110000)
	{
		szOutput.append(1, static_cast<char>(0xF0 | (codepoint >> 18)));
		szOutput.append(1, static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
		szOutput.append(1, static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
		szOutput.append(1, static_cast<char>(0x80 | (codepoint & 0x3F)));
	}
}


/*
 * end of the tag that opens at pos (the position of its '>'), honouring
 * quoted attribute values. npos if the tag is not closed.
 */
static size_t find_tag_end(const std::string &szPage, size_t pos)
{
	char quote = 0;
	for (size_t i = pos + 1; i < szPage.size(); i++)
	{
		char c = szPage[i];
		if (quote)
		{
			if (c == quote)
				quote = 0;
		}
		else if ((c == '"') || (c == '\''))
			quote = c;
		else if (c == '>')
			return i;
	}
	return std::string::npos;
}


/*
 * Collect up to maxcount start tags named szTagName. Comments and the
 * content of <script> and <style> elements are skipped.
 */
static std::vector<std::string> find_start_tags(const std::string &szPage, const std::string &szTagName, const size_t maxcount = 0)
{
	std::vector<std::string> vTags;
	std::string szLowerPage = to_lower(szPage);
	size_t pos = szLowerPage.find('<');
	while (pos != std::string::npos)
	{
		if (szLowerPage.compare(pos, 4, "<!--") == 0)
		{
			size_t endpos = szLowerPage.find("-->", pos + 4);
			if (endpos == std::string::npos)
				break;
			pos = szLowerPage.find('<', endpos + 3);
			continue;
		}

		size_t namestart = pos + 1;
		size_t nameend = namestart;
		while ((nameend < szLowerPage.size()) && (std::isalnum(static_cast<unsigned char>(szLowerPage[nameend])) || (szLowerPage[nameend] == '-')))
			nameend++;
		std::string szName = szLowerPage.substr(namestart, nameend - namestart);
		if (szName.empty())
		{
			pos = szLowerPage.find('<', pos + 1);
			continue;
		}

		size_t tagend = find_tag_end(szLowerPage, pos);
		if (tagend == std::string::npos)
			break;

		if (szName == szTagName)
		{
			vTags.push_back(szPage.substr(pos, tagend - pos + 1));
			if ((maxcount > 0) && (vTags.size() >= maxcount))
				break;
		}

		if ((szName == "script") || (szName == "style"))
		{
			size_t closepos = szLowerPage.find("</" + szName, tagend);
			if (closepos == std::string::npos)
				break;
			tagend = closepos;
		}
		pos = szLowerPage.find('<', tagend + 1);
	}
	return vTags;
}


std::string decode_entities(const std::string &szText)
{
	std::string szResult;
	size_t pos = 0;
	while (pos < szText.size())
	{
		if (szText[pos] != '&')
		{
			szResult.append(1, szText[pos]);
			pos++;
			continue;
		}
		size_t endpos = szText.find(';', pos);
		if ((endpos == std::string::npos) || (endpos - pos > 10))
		{
			szResult.append(1, '&');
			pos++;
			continue;
		}
		std::string szEntity = szText.substr(pos + 1, endpos - pos - 1);
		if (szEntity == "amp")
			szResult.append(1, '&');
		else if (szEntity == "lt")
			szResult.append(1, '<');
		else if (szEntity == "gt")
			szResult.append(1, '>');
		else if (szEntity == "quot")
			szResult.append(1, '"');
		else if (szEntity == "apos")
			szResult.append(1, '\'');
		else if ((szEntity.size() > 1) && (szEntity[0] == '#'))
		{
			char *pEnd = nullptr;
			unsigned long codepoint;
			if ((szEntity[1] == 'x') || (szEntity[1] == 'X'))
				codepoint = strtoul(szEntity.c_str() + 2, &pEnd, 16);
			else
				codepoint = strtoul(szEntity.c_str() + 1, &pEnd, 10);
			if ((pEnd == nullptr) || (*pEnd != '\0'))
			{
				szResult.append(szText, pos, endpos - pos + 1);
				pos = endpos + 1;
				continue;
			}
			append_utf8(szResult, codepoint);
		}
		else
		{
			// unknown reference, keep it verbatim
			szResult.append(szText, pos, endpos - pos + 1);
		}
		pos = endpos + 1;
	}
	return szResult;
}


std::map<std::string, std::string> get_tag_attributes(const std::string &szTag)
{
	std::map<std::string, std::string> mAttributes;
	size_t pos = 0;
	if ((pos < szTag.size()) && (szTag[pos] == '<'))
		pos++;
	// skip the tag name
	while ((pos < szTag.size()) && !is_space(szTag[pos]) && (szTag[pos] != '>') && (szTag[pos] != '/'))
		pos++;

	while (pos < szTag.size())
	{
		while ((pos < szTag.size()) && (is_space(szTag[pos]) || (szTag[pos] == '/')))
			pos++;
		if ((pos >= szTag.size()) || (szTag[pos] == '>'))
			break;

		size_t namestart = pos;
		while ((pos < szTag.size()) && !is_space(szTag[pos]) && (szTag[pos] != '=') && (szTag[pos] != '>') && (szTag[pos] != '/'))
			pos++;
		std::string szName = to_lower(szTag.substr(namestart, pos - namestart));

		while ((pos < szTag.size()) && is_space(szTag[pos]))
			pos++;

		std::string szValue;
		if ((pos < szTag.size()) && (szTag[pos] == '='))
		{
			pos++;
			while ((pos < szTag.size()) && is_space(szTag[pos]))
				pos++;
			if ((pos < szTag.size()) && ((szTag[pos] == '"') || (szTag[pos] == '\'')))
			{
				char quote = szTag[pos];
				size_t valuestart = pos + 1;
				size_t valueend = szTag.find(quote, valuestart);
				if (valueend == std::string::npos)
					valueend = szTag.size();
				szValue = szTag.substr(valuestart, valueend - valuestart);
				pos = valueend + 1;
			}
			else
			{
				size_t valuestart = pos;
				while ((pos < szTag.size()) && !is_space(szTag[pos]) && (szTag[pos] != '>'))
					pos++;
				szValue = szTag.substr(valuestart, pos - valuestart);
			}
		}

		if (!szName.empty() && (mAttributes.find(szName) == mAttributes.end()))
			mAttributes[szName] = decode_entities(szValue);
	}
	return mAttributes;
}


bool extract_settings_json(const std::string &szPage, std::string &szJson)
{
	const std::string &szPrefix = mobilelink::API::signin::settingsPrefix;
	size_t linestart = 0;
	while (linestart <= szPage.size())
	{
		size_t lineend = szPage.find('\n', linestart);
		if (lineend == std::string::npos)
			lineend = szPage.size();
		std::string szLine = szPage.substr(linestart, lineend - linestart);
		if (!szLine.empty() && (szLine[szLine.size() - 1] == '\r'))
			szLine.erase(szLine.size() - 1);

		if ((szLine.size() > szPrefix.size()) && (szLine.compare(0, szPrefix.size(), szPrefix) == 0) && (szLine[szLine.size() - 1] == ';'))
		{
			szJson = szLine.substr(szPrefix.size(), szLine.size() - szPrefix.size() - 1);
			return true;
		}
		linestart = lineend + 1;
	}
	return false;
}


bool extract_final_form(const std::string &szPage, mobilelink::html::finalForm &form)
{
	std::vector<std::string> vForms = find_start_tags(szPage, "form", 1);
	if (vForms.empty())
		return false;
	std::map<std::string, std::string> mForm = get_tag_attributes(vForms[0]);
	if (mForm.find("action") == mForm.end())
		return false;

	bool bHasState = false;
	bool bHasCode = false;
	std::vector<std::string> vInputs = find_start_tags(szPage, "input");
	std::vector<std::string>::const_iterator itt;
	for (itt = vInputs.begin(); itt != vInputs.end(); ++itt)
	{
		std::map<std::string, std::string> mInput = get_tag_attributes(*itt);
		std::map<std::string, std::string>::const_iterator name = mInput.find("name");
		std::map<std::string, std::string>::const_iterator value = mInput.find("value");
		if (name == mInput.end())
			continue;
		if ((name->second == "state") && !bHasState)
		{
			if (value == mInput.end())
				return false;
			form.szState = value->second;
			bHasState = true;
		}
		else if ((name->second == "code") && !bHasCode)
		{
			if (value == mInput.end())
				return false;
			form.szCode = value->second;
			bHasCode = true;
		}
	}
	if (!bHasState || !bHasCode)
		return false;

	form.szAction = mForm["action"];
	return true;
}

  }; // namespace html
}; // namespace mobilelink

