/*
	This project is licensed under
	Creative Commons Attribution-NonCommercial-ShareAlike 4.0 International Public License (CC BY-NC-SA 4.0).

	A SUMMARY OF THIS LICENSE CAN BE FOUND HERE: https://creativecommons.org/licenses/by-nc-sa/4.0/

	Author: discord/bruh4096#4512

	This file contains declarations of the navigation data lookup interface
    used by the route decoder.
*/

#pragma once

#include <libnav/geo_utils.hpp>
#include <string>
#include <vector>


namespace rtedec
{
    const std::string ENRT_AREA = "ENRT";


    enum class WptUsage
    {
        VFR_TERMINAL,
        VFR_ENROUTE
    };

    struct airport_rec_t
    {
        std::string icao;
        geo::point pos;
        double elev_ft;
    };

    struct runway_rec_t
    {
        std::string id;
        geo::point start, end;
    };

    struct wpt_rec_t
    {
        std::string id;
        std::string area;  // Terminal area or ENRT_AREA
        geo::point pos;
        WptUsage usage;
    };

    inline bool operator==(wpt_rec_t const& a, wpt_rec_t const& b)
    {
        return a.id == b.id && a.area == b.area && a.usage == b.usage &&
            a.pos.lat_rad == b.pos.lat_rad && a.pos.lon_rad == b.pos.lon_rad;
    }

    inline bool operator!=(wpt_rec_t const& a, wpt_rec_t const& b)
    {
        return !operator==(a, b);
    }


    /*
        NavDataSrc is the only way the decoder reaches navigation data.
        Implementations must not be mutated while a lookup is in progress.
    */

    class NavDataSrc
    {
    public:
        virtual ~NavDataSrc() = default;

        virtual bool get_airport(const std::string& icao, airport_rec_t *out) const = 0;

        virtual bool get_runway(const std::string& icao, const std::string& rwy_id,
            runway_rec_t *out) const = 0;

        virtual bool get_terminal_wpt(const std::string& id, const std::string& area,
            wpt_rec_t *out) const = 0;

        /*
            Function: get_enrt_wpts
            Description:
            Finds all enroute waypoints with a given identifier.
            @param id: waypoint identifier
            @param out: pointer to vector that receives matches. Order is stable
            and the first entry is the preferred match.
            @return number of matches
        */

        virtual size_t get_enrt_wpts(const std::string& id,
            std::vector<wpt_rec_t> *out) const = 0;

        virtual std::string get_terminal_area(const std::string& icao) const = 0;
    };
}; // namespace rtedec
