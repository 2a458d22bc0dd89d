/*
	This project is licensed under
	Creative Commons Attribution-NonCommercial-ShareAlike 4.0 International Public License (CC BY-NC-SA 4.0).

	A SUMMARY OF THIS LICENSE CAN BE FOUND HERE: https://creativecommons.org/licenses/by-nc-sa/4.0/

	Author: discord/bruh4096#4512

	This file contains declarations of preference file handling.
    Preference files have one "KEY value" pair per line. Lines starting 
    with # are ignored.
*/

#pragma once

#include <string>


namespace rtedec
{
    const std::string PREFS_FILE_NM = "prefs.txt";

    const std::string PREFS_EARTH_PATH = "EPATH";
    const std::string PREFS_APT_DIR = "APTDIR";


    struct nav_prefs_t
    {
        std::string earth_nav_path;
        std::string apt_dat_dir;
    };


    /*
        Function: fetch_prefs_data
        Description:
        Reads navigation data paths from a preference file. Keys that are
        missing leave the corresponding field untouched.
        @param file_nm: path to the preference file
        @param out: pointer to output preferences
        @return true if the file exists
    */

    bool fetch_prefs_data(std::string file_nm, nav_prefs_t *out);

    bool update_prefs(std::string file_nm, const nav_prefs_t& prefs);
}; // namespace rtedec
