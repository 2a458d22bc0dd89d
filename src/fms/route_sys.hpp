/*
	This project is licensed under
	Creative Commons Attribution-NonCommercial-ShareAlike 4.0 International Public License (CC BY-NC-SA 4.0).

	A SUMMARY OF THIS LICENSE CAN BE FOUND HERE: https://creativecommons.org/licenses/by-nc-sa/4.0/

	Author: discord/bruh4096#4512

	This file contains declarations of member functions for RouteSys class. 
    This class owns the navigation data, the route string and the decoded 
    route of a planning session.
*/

#pragma once

#include "rte/route.hpp"
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>


namespace rtedec
{
    const std::string EPOCH_UTC_S_VAR = "epoch_utc_s";
    const std::string CRUISE_FF_VAR = "cruise_ff";

    // Empty means absent
    const std::vector<std::string> RSV_VARS = {EPOCH_UTC_S_VAR, CRUISE_FF_VAR};


    class RouteSys
    {
    public:
        std::unordered_map<std::string, std::string> env_vars;


        // nd must not be null
        RouteSys(std::shared_ptr<NavDataSrc> nd, 
            std::shared_ptr<MagVarModel> mv=nullptr);

        /*
            Function: decode
            Description:
            Decodes and stores a route. On failure the stored route is cleared,
            the route string is kept for later re-decoding.
            @param rte_str: route string
            @return DecodeErr::SUCCESS or the decode error
        */

        DecodeErr decode(std::string rte_str);

        /*
            Function: set_nav_data
            Description:
            Replaces navigation data and decodes the stored route string 
            against it. Waits for running decodes to finish.
            @param nd: new navigation data
            @return result of re-decoding. SUCCESS if there was no route string.
        */

        DecodeErr set_nav_data(std::shared_ptr<NavDataSrc> nd);

        void set_profile(std::shared_ptr<CruiseProfile> prof);

        DecodeErr set_alternate(std::string ident);

        bool get_alternate(leg_t *out);

        std::shared_ptr<const Route> get_route();

        std::string get_route_str();

        err_info_t get_last_err();

        void print_route();

    private:
        std::shared_mutex nd_mtx;
        std::shared_ptr<NavDataSrc> nd_ptr;

        std::mutex rte_mtx;
        std::string rte_str_curr;
        std::shared_ptr<const Route> route;
        err_info_t last_err;
        std::string altn_id;
        bool has_altn;
        leg_t altn_leg;

        std::shared_ptr<CruiseProfile> profile;
        std::shared_ptr<MagVarModel> magvar;


        // Must be called with rte_mtx held
        leg_env_t get_leg_env();

        // Must be called with nd_mtx and rte_mtx held
        DecodeErr decode_locked(std::string rte_str);

        // Must be called with nd_mtx and rte_mtx held
        DecodeErr update_altn();
    };
}; // namespace rtedec
