/*
	This project is licensed under
	Creative Commons Attribution-NonCommercial-ShareAlike 4.0 International Public License (CC BY-NC-SA 4.0).

	A SUMMARY OF THIS LICENSE CAN BE FOUND HERE: https://creativecommons.org/licenses/by-nc-sa/4.0/

	Author: discord/bruh4096#4512

	This file contains declarations of functions that resolve airport and 
    waypoint identifiers against navigation data.
*/

#pragma once

#include "decode_err.hpp"
#include "scope.hpp"
#include "nav/nav_data.hpp"


namespace rtedec
{
    enum class FixType
    {
        AIRPORT,
        WAYPOINT
    };

    struct fix_t
    {
        FixType tp;
        std::string id;
        std::string area;  // Terminal area for airports and terminal waypoints
        geo::point pos;
        WptUsage usage;    // Waypoints only
        bool has_rwy;
        std::string rwy_id;


        std::string get_name() const;
    };

    bool operator==(fix_t const& a, fix_t const& b);
    bool operator!=(fix_t const& a, fix_t const& b);


    /*
        Function: resolve_airport
        Description:
        Looks up an airport and, optionally, one of its runways.
        @param icao: ICAO code
        @param rwy_id: runway designator. Empty if no runway was given
        @param nd: navigation data
        @param out: pointer to output fix
        @return DecodeErr::UNKNOWN_AIRPORT, DecodeErr::INVALID_RUNWAY or 
        DecodeErr::SUCCESS
    */

    DecodeErr resolve_airport(const std::string& icao, const std::string& rwy_id,
        const NavDataSrc& nd, fix_t *out);

    /*
        Function: resolve_wpt
        Description:
        Resolves a waypoint identifier. Terminal areas in scope are searched
        first. If the scope is crossing between two areas, a match in only one
        of them wins. A match in both is ambiguous unless the area being left
        was pinned by DCT <airport>. Enroute waypoints are searched last and 
        the first one returned by the navigation data wins.
        @param id: waypoint identifier
        @param scope: terminal area scope at the waypoint
        @param nd: navigation data
        @param out: pointer to output fix
        @return DecodeErr::AMBIGUOUS_WPT, DecodeErr::UNKNOWN_WPT or
        DecodeErr::SUCCESS
    */

    DecodeErr resolve_wpt(const std::string& id, const TermScope& scope,
        const NavDataSrc& nd, fix_t *out);
}; // namespace rtedec
