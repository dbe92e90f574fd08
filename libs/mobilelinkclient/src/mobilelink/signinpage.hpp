/*
 * Copyright (c) 2020 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Scraping of the MobileLink sign-in pages
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#pragma once
#include <map>
#include <string>


namespace mobilelink {
  namespace html {

    typedef struct _sFinalForm
    {
      std::string szAction;
      std::string szState;
      std::string szCode;
    } finalForm;


/*
 * Find the line `var SETTINGS = {...};` in the sign-in page and return the
 * json text between the prefix and the trailing semicolon.
 */
    bool extract_settings_json(const std::string &szPage, std::string &szJson);


/*
 * Find the confirmation form: the action of the first <form> and the values
 * of the first <input> elements named "state" and "code". Returns false if
 * any of those is missing.
 */
    bool extract_final_form(const std::string &szPage, mobilelink::html::finalForm &form);


    // lower case attribute name -> decoded value, for a tag like <input name="x" value='y'>
    std::map<std::string, std::string> get_tag_attributes(const std::string &szTag);

    std::string decode_entities(const std::string &szText);

  }; // namespace html
}; // namespace mobilelink

