/*
	This project is licensed under
	Creative Commons Attribution-NonCommercial-ShareAlike 4.0 International Public License (CC BY-NC-SA 4.0).

	A SUMMARY OF THIS LICENSE CAN BE FOUND HERE: https://creativecommons.org/licenses/by-nc-sa/4.0/

	Author: discord/bruh4096#4512

	This file contains definitions of preference file handling.
*/

#include "prefs.hpp"
#include <libnav/common.hpp>
#include <libnav/str_utils.hpp>
#include <fstream>
#include <vector>


namespace rtedec
{
    bool fetch_prefs_data(std::string file_nm, nav_prefs_t *out)
    {
        if(!libnav::does_file_exist(file_nm))
            return false;

        std::ifstream file(file_nm);

        std::string line;
        while(getline(file, line))
        {
            line = strutils::strip(line);
            if(line.size() && line[0] != '#')
            {
                std::vector<std::string> str_split = strutils::str_split(line, ' ', 1);

                if(str_split.size() == 2)
                {
                    if(str_split[0] == PREFS_EARTH_PATH)
                        out->earth_nav_path = str_split[1];
                    else if(str_split[0] == PREFS_APT_DIR)
                        out->apt_dat_dir = str_split[1];
                }
            }
        }

        file.close();
        return true;
    }

    bool update_prefs(std::string file_nm, const nav_prefs_t& prefs)
    {
        std::ofstream out(file_nm, std::ofstream::out);
        if(!out.is_open())
            return false;

        out << PREFS_EARTH_PATH << " " << prefs.earth_nav_path << "\n";
        out << PREFS_APT_DIR << " " << prefs.apt_dat_dir << "\n";

        out.close();
        return true;
    }
}; // namespace rtedec
