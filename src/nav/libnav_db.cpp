/*
	This project is licensed under
	Creative Commons Attribution-NonCommercial-ShareAlike 4.0 International Public License (CC BY-NC-SA 4.0).

	A SUMMARY OF THIS LICENSE CAN BE FOUND HERE: https://creativecommons.org/licenses/by-nc-sa/4.0/

	Author: discord/bruh4096#4512

	This file contains definitions of member functions for LibnavNavDB class.
    LibnavNavDB answers route decoder lookups from X-Plane navigation data 
    loaded by libnav.
*/

#include "libnav_db.hpp"
#include <iostream>


namespace rtedec
{
    // LibnavNavDB member function definitions:

    // Public member functions:

    LibnavNavDB::LibnavNavDB(std::shared_ptr<libnav::ArptDB> arpt_db, 
        std::shared_ptr<libnav::NavaidDB> navaid_db)
    {
        arpt_db_ptr = arpt_db;
        navaid_db_ptr = navaid_db;
    }

    LibnavNavDB::LibnavNavDB(std::string apt_dat, std::string custom_apt, 
        std::string custom_rnw, std::string fix_data, std::string navaid_data)
    {
        arpt_db_ptr = 
            std::make_shared<libnav::ArptDB>(apt_dat, custom_apt, custom_rnw);
        navaid_db_ptr = 
            std::make_shared<libnav::NavaidDB>(fix_data, navaid_data);

        if(arpt_db_ptr->get_err() != libnav::DbErr::SUCCESS)
        {
            std::cout << "Unable to load airport database\n";
        }
        if(navaid_db_ptr->get_wpt_err() != libnav::DbErr::SUCCESS)
        {
            std::cout << "Unable to load waypoint database\n";
        }
    }

    libnav::DbErr LibnavNavDB::get_err() const
    {
        libnav::DbErr err_arpt = arpt_db_ptr->get_err();
        if(err_arpt != libnav::DbErr::SUCCESS)
            return err_arpt;
        return navaid_db_ptr->get_wpt_err();
    }

    bool LibnavNavDB::get_airport(const std::string& icao, airport_rec_t *out) const
    {
        if(!arpt_db_ptr->is_airport(icao))
            return false;

        libnav::airport_data_t arpt_data;
        size_t n_found = arpt_db_ptr->get_airport_data(icao, &arpt_data);
        if(!n_found)
            return false;

        out->icao = icao;
        out->pos = arpt_data.pos;
        out->elev_ft = arpt_data.elevation_ft;
        return true;
    }

    bool LibnavNavDB::get_runway(const std::string& icao, const std::string& rwy_id,
        runway_rec_t *out) const
    {
        libnav::runway_entry_t rnw_data;
        int data_found = arpt_db_ptr->get_rnw_data(icao, rwy_id, &rnw_data);
        if(!data_found)
            return false;

        out->id = rwy_id;
        out->start = rnw_data.start;
        out->end = rnw_data.end;
        return true;
    }

    bool LibnavNavDB::get_terminal_wpt(const std::string& id, const std::string& area,
        wpt_rec_t *out) const
    {
        std::vector<libnav::waypoint_entry_t> wpt_entr;
        size_t n_found = navaid_db_ptr->get_wpt_data(id, &wpt_entr, area);

        for(size_t i = 0; i < n_found && i < wpt_entr.size(); i++)
        {
            if(wpt_entr[i].area_code == area)
            {
                *out = {id, area, wpt_entr[i].pos, WptUsage::VFR_TERMINAL};
                return true;
            }
        }
        return false;
    }

    size_t LibnavNavDB::get_enrt_wpts(const std::string& id,
        std::vector<wpt_rec_t> *out) const
    {
        out->clear();

        std::vector<libnav::waypoint_entry_t> wpt_entr;
        size_t n_found = navaid_db_ptr->get_wpt_data(id, &wpt_entr);

        for(size_t i = 0; i < n_found && i < wpt_entr.size(); i++)
        {
            if(wpt_entr[i].area_code == ENRT_AREA)
                out->push_back({id, ENRT_AREA, wpt_entr[i].pos, WptUsage::VFR_ENROUTE});
        }
        return out->size();
    }

    std::string LibnavNavDB::get_terminal_area(const std::string& icao) const
    {
        // X-Plane stores terminal fixes with the airport's ICAO as region
        return icao;
    }


    std::shared_ptr<LibnavNavDB> load_libnav_db(std::string apt_dat_dir, 
        std::string earth_nav_path)
    {
        std::shared_ptr<LibnavNavDB> out = std::make_shared<LibnavNavDB>(
            apt_dat_dir + APT_DAT_NM, CUSTOM_APT_NM, CUSTOM_RNW_NM, 
            earth_nav_path + FIX_DAT_NM, earth_nav_path + NAV_DAT_NM);

        if(out->get_err() != libnav::DbErr::SUCCESS)
        {
            std::cout << "Navigation data loaded with errors\n";
        }
        else
        {
            std::cout << "Navigation data loaded\n";
        }

        return out;
    }
}; // namespace rtedec
