/*
	This project is licensed under
	Creative Commons Attribution-NonCommercial-ShareAlike 4.0 International Public License (CC BY-NC-SA 4.0).

	A SUMMARY OF THIS LICENSE CAN BE FOUND HERE: https://creativecommons.org/licenses/by-nc-sa/4.0/

	Author: discord/bruh4096#4512

	This file contains declarations of member functions for Route class and
    the route decoder.
*/

#pragma once

#include "token.hpp"
#include "leg.hpp"


namespace rtedec
{
    struct leg_totals_t
    {
        double dist_nm;
        std::optional<double> ete_hr;
        std::optional<double> fuel;
    };


    class Route;

    /*
        Function: decode
        Description:
        Decodes a route string of the form 
        [WIND] SPEED LEVEL ORIGIN {[DCT] WAYPOINT}* DESTINATION
        into legs. Wind, speed and level may appear anywhere and stay in force
        until overridden. Nothing is written to out on failure.
        @param rte_str: route string. Case insensitive
        @param nd: navigation data. Only read
        @param out: pointer to output route
        @param env: inputs for fuel and magnetic course
        @param err: optional pointer that receives the error with the
        offending token and its index
        @return DecodeErr::SUCCESS or the first error found
    */

    DecodeErr decode(const std::string& rte_str, const NavDataSrc& nd, Route *out,
        const leg_env_t& env=leg_env_t(), err_info_t *err=nullptr);


    class Route
    {
    public:
        Route();

        const std::vector<leg_t>& get_legs() const;

        size_t get_n_legs() const;

        bool get_origin(fix_t *out) const;

        bool get_dest(fix_t *out) const;

        // First airport of the chain and the last airport after it,
        // wherever they appear
        bool get_dep_arpt(fix_t *out) const;

        bool get_arr_arpt(fix_t *out) const;

        bool get_takeoff_rwy(std::string *out) const;

        bool get_landing_rwy(std::string *out) const;

        // First speed and level of the route
        std::optional<speed_t> get_cruise_spd() const;

        std::optional<level_t> get_cruise_lvl() const;

        /*
            Function: accumulate_legs
            Description:
            Gets running totals up to and including each leg. ETE and fuel
            totals become absent from the first leg that lacks them on.
            @return one entry per leg
        */

        std::vector<leg_totals_t> accumulate_legs() const;

        bool get_totals(leg_totals_t *out) const;

        std::string to_str() const;

        friend DecodeErr decode(const std::string& rte_str, const NavDataSrc& nd, 
            Route *out, const leg_env_t& env, err_info_t *err);

    private:
        std::vector<token_t> tokens;
        std::vector<leg_t> legs;
        std::optional<speed_t> crz_spd;
        std::optional<level_t> crz_lvl;
    };
}; // namespace rtedec
