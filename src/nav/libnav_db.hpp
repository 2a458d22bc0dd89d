/*
	This project is licensed under
	Creative Commons Attribution-NonCommercial-ShareAlike 4.0 International Public License (CC BY-NC-SA 4.0).

	A SUMMARY OF THIS LICENSE CAN BE FOUND HERE: https://creativecommons.org/licenses/by-nc-sa/4.0/

	Author: discord/bruh4096#4512

	This file contains declarations of member functions for LibnavNavDB class.
    LibnavNavDB answers route decoder lookups from X-Plane navigation data 
    loaded by libnav.
*/

#pragma once

#include "nav_data.hpp"
#include <libnav/arpt_db.hpp>
#include <libnav/navaid_db.hpp>
#include <libnav/common.hpp>
#include <memory>


namespace rtedec
{
    const std::string APT_DAT_NM = "apt.dat";
    const std::string CUSTOM_APT_NM = "rte_arpt.dat";
    const std::string CUSTOM_RNW_NM = "rte_rnw.dat";
    const std::string FIX_DAT_NM = "earth_fix.dat";
    const std::string NAV_DAT_NM = "earth_nav.dat";


    class LibnavNavDB: public NavDataSrc
    {
    public:
        LibnavNavDB(std::shared_ptr<libnav::ArptDB> arpt_db, 
            std::shared_ptr<libnav::NavaidDB> navaid_db);

        LibnavNavDB(std::string apt_dat, std::string custom_apt, std::string custom_rnw,
            std::string fix_data, std::string navaid_data);

        /*
            Function: get_err
            Description:
            Returns the first load error of the underlying data bases.
            @return libnav::DbErr::SUCCESS if everything loaded
        */

        libnav::DbErr get_err() const;

        bool get_airport(const std::string& icao, airport_rec_t *out) const override;

        bool get_runway(const std::string& icao, const std::string& rwy_id,
            runway_rec_t *out) const override;

        bool get_terminal_wpt(const std::string& id, const std::string& area,
            wpt_rec_t *out) const override;

        size_t get_enrt_wpts(const std::string& id,
            std::vector<wpt_rec_t> *out) const override;

        std::string get_terminal_area(const std::string& icao) const override;

    private:
        std::shared_ptr<libnav::ArptDB> arpt_db_ptr;
        std::shared_ptr<libnav::NavaidDB> navaid_db_ptr;
    };


    std::shared_ptr<LibnavNavDB> load_libnav_db(std::string apt_dat_dir, 
        std::string earth_nav_path);
}; // namespace rtedec
