/*
	This project is licensed under
	Creative Commons Attribution-NonCommercial-ShareAlike 4.0 International Public License (CC BY-NC-SA 4.0).

	A SUMMARY OF THIS LICENSE CAN BE FOUND HERE: https://creativecommons.org/licenses/by-nc-sa/4.0/

	Author: discord/bruh4096#4512

	This file contains definitions of functions that resolve airport and 
    waypoint identifiers against navigation data.
*/

#include "fix_resolver.hpp"


namespace rtedec
{
    fix_t wpt_to_fix(const wpt_rec_t& wpt)
    {
        fix_t out;
        out.tp = FixType::WAYPOINT;
        out.id = wpt.id;
        out.area = wpt.area;
        out.pos = wpt.pos;
        out.usage = wpt.usage;
        out.has_rwy = false;
        return out;
    }

    std::string fix_t::get_name() const
    {
        if(has_rwy)
            return id + rwy_id;
        return id;
    }

    bool operator==(fix_t const& a, fix_t const& b)
    {
        return a.tp == b.tp && a.id == b.id && a.area == b.area && 
            a.pos.lat_rad == b.pos.lat_rad && a.pos.lon_rad == b.pos.lon_rad &&
            a.has_rwy == b.has_rwy && a.rwy_id == b.rwy_id;
    }

    bool operator!=(fix_t const& a, fix_t const& b)
    {
        return !operator==(a, b);
    }

    DecodeErr resolve_airport(const std::string& icao, const std::string& rwy_id,
        const NavDataSrc& nd, fix_t *out)
    {
        airport_rec_t arpt;
        if(!nd.get_airport(icao, &arpt))
            return DecodeErr::UNKNOWN_AIRPORT;

        fix_t tmp;
        tmp.tp = FixType::AIRPORT;
        tmp.id = arpt.icao;
        tmp.area = nd.get_terminal_area(arpt.icao);
        tmp.pos = arpt.pos;
        tmp.usage = WptUsage::VFR_TERMINAL;
        tmp.has_rwy = false;

        if(rwy_id != "")
        {
            runway_rec_t rwy;
            if(!nd.get_runway(icao, rwy_id, &rwy))
                return DecodeErr::INVALID_RUNWAY;
            tmp.has_rwy = true;
            tmp.rwy_id = rwy_id;
        }

        *out = tmp;
        return DecodeErr::SUCCESS;
    }

    DecodeErr resolve_wpt(const std::string& id, const TermScope& scope,
        const NavDataSrc& nd, fix_t *out)
    {
        ScopeState st = scope.get_state();
        if(st == ScopeState::OPEN)
        {
            wpt_rec_t wpt;
            if(nd.get_terminal_wpt(id, scope.get_area(), &wpt))
            {
                *out = wpt_to_fix(wpt);
                return DecodeErr::SUCCESS;
            }
        }
        else if(st == ScopeState::CROSSING)
        {
            wpt_rec_t wpt_from, wpt_to;
            bool in_from = nd.get_terminal_wpt(id, scope.get_area(), &wpt_from);
            bool in_to = nd.get_terminal_wpt(id, scope.get_next_area(), &wpt_to);

            if(in_from && in_to && wpt_from != wpt_to && !scope.is_pinned())
                return DecodeErr::AMBIGUOUS_WPT;
            if(in_from)
            {
                *out = wpt_to_fix(wpt_from);
                return DecodeErr::SUCCESS;
            }
            if(in_to)
            {
                *out = wpt_to_fix(wpt_to);
                return DecodeErr::SUCCESS;
            }
        }

        std::vector<wpt_rec_t> enrt;
        size_t n_found = nd.get_enrt_wpts(id, &enrt);
        if(n_found && enrt.size())
        {
            *out = wpt_to_fix(enrt[0]);
            return DecodeErr::SUCCESS;
        }

        return DecodeErr::UNKNOWN_WPT;
    }
}; // namespace rtedec
