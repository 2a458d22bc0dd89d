/*
	This project is licensed under
	Creative Commons Attribution-NonCommercial-ShareAlike 4.0 International Public License (CC BY-NC-SA 4.0).

	A SUMMARY OF THIS LICENSE CAN BE FOUND HERE: https://creativecommons.org/licenses/by-nc-sa/4.0/

	Author: discord/bruh4096#4512

	This file contains definitions of member functions for RouteSys class.
    This class owns the navigation data, the route string and the decoded 
    route of a planning session.
*/

#include "route_sys.hpp"
#include <libnav/str_utils.hpp>
#include <iostream>


namespace rtedec
{
    constexpr int N_PRINT_PREC = 1;


    std::string opt_to_str(const std::optional<double>& val)
    {
        if(!val.has_value())
            return "---";
        return strutils::double_to_str(val.value(), N_PRINT_PREC);
    }

    // RouteSys member function definitions:

    // Public member functions:

    RouteSys::RouteSys(std::shared_ptr<NavDataSrc> nd, std::shared_ptr<MagVarModel> mv)
    {
        for(size_t i = 0; i < RSV_VARS.size(); i++)
        {
            env_vars[RSV_VARS[i]] = "";
        }

        nd_ptr = nd;
        magvar = mv;
        profile = nullptr;

        rte_str_curr = "";
        route = nullptr;
        last_err = {DecodeErr::SUCCESS, "", ERR_POS_NONE};
        altn_id = "";
        has_altn = false;
    }

    DecodeErr RouteSys::decode(std::string rte_str)
    {
        std::shared_lock<std::shared_mutex> nd_lock(nd_mtx);
        std::lock_guard<std::mutex> lock(rte_mtx);

        return decode_locked(rte_str);
    }

    DecodeErr RouteSys::set_nav_data(std::shared_ptr<NavDataSrc> nd)
    {
        std::unique_lock<std::shared_mutex> nd_lock(nd_mtx);
        std::lock_guard<std::mutex> lock(rte_mtx);

        nd_ptr = nd;

        if(rte_str_curr == "")
            return DecodeErr::SUCCESS;
        return decode_locked(rte_str_curr);
    }

    void RouteSys::set_profile(std::shared_ptr<CruiseProfile> prof)
    {
        std::lock_guard<std::mutex> lock(rte_mtx);

        profile = prof;
    }

    DecodeErr RouteSys::set_alternate(std::string ident)
    {
        std::shared_lock<std::shared_mutex> nd_lock(nd_mtx);
        std::lock_guard<std::mutex> lock(rte_mtx);

        altn_id = strutils::strip(ident);
        DecodeErr err = update_altn();
        if(err != DecodeErr::SUCCESS)
        {
            std::cout << "Invalid alternate " << altn_id << ": " << 
                get_err_str(err) << "\n";
            altn_id = "";
        }
        return err;
    }

    bool RouteSys::get_alternate(leg_t *out)
    {
        std::lock_guard<std::mutex> lock(rte_mtx);

        if(!has_altn)
            return false;
        *out = altn_leg;
        return true;
    }

    std::shared_ptr<const Route> RouteSys::get_route()
    {
        std::lock_guard<std::mutex> lock(rte_mtx);

        return route;
    }

    std::string RouteSys::get_route_str()
    {
        std::lock_guard<std::mutex> lock(rte_mtx);

        return rte_str_curr;
    }

    err_info_t RouteSys::get_last_err()
    {
        std::lock_guard<std::mutex> lock(rte_mtx);

        return last_err;
    }

    void RouteSys::print_route()
    {
        std::shared_ptr<const Route> rte = get_route();
        if(rte == nullptr)
        {
            std::cout << "No route\n";
            return;
        }

        std::cout << rte->to_str() << "\n";

        const std::vector<leg_t>& legs = rte->get_legs();
        std::vector<leg_totals_t> totals = rte->accumulate_legs();
        for(size_t i = 0; i < legs.size(); i++)
        {
            std::cout << legs[i].origin.get_name() << " -> " << legs[i].dest.get_name() <<
                " TC " << strutils::double_to_str(legs[i].true_crs_deg, N_PRINT_PREC) << 
                " MC " << opt_to_str(legs[i].mag_crs_deg) <<
                " DIST " << strutils::double_to_str(legs[i].dist_nm, N_PRINT_PREC) <<
                " GS " << opt_to_str(legs[i].gs_kts) <<
                " HDG " << opt_to_str(legs[i].hdg_deg) <<
                " MH " << opt_to_str(legs[i].mag_hdg_deg) <<
                " ETE " << opt_to_str(legs[i].ete_hr) <<
                " FUEL " << opt_to_str(legs[i].fuel) <<
                " TOT " << opt_to_str(totals[i].ete_hr) << "\n";
        }

        leg_t altn;
        if(get_alternate(&altn))
        {
            std::cout << "ALTN " << altn.origin.get_name() << " -> " << 
                altn.dest.get_name() << " DIST " << 
                strutils::double_to_str(altn.dist_nm, N_PRINT_PREC) << "\n";
        }
    }

    // Private member functions:

    leg_env_t RouteSys::get_leg_env()
    {
        leg_env_t out;
        out.profile = profile;
        out.magvar = magvar;

        std::string epoch_str = env_vars[EPOCH_UTC_S_VAR];
        if(epoch_str.size() && strutils::is_numeric(epoch_str))
            out.date = std::time_t(strutils::strtod(epoch_str));

        std::string ff_str = env_vars[CRUISE_FF_VAR];
        if(out.profile == nullptr && ff_str.size() && strutils::is_numeric(ff_str))
            out.profile = std::make_shared<ConstFFProfile>(strutils::strtod(ff_str));

        return out;
    }

    DecodeErr RouteSys::decode_locked(std::string rte_str)
    {
        rte_str_curr = rte_str;

        Route tmp;
        err_info_t err;
        DecodeErr res = rtedec::decode(rte_str, *nd_ptr, &tmp, get_leg_env(), &err);
        last_err = err;

        if(res != DecodeErr::SUCCESS)
        {
            std::cout << "Route decode failed: " << get_err_str(res);
            if(err.pos != ERR_POS_NONE)
                std::cout << " at token " << err.pos << " " << err.token;
            std::cout << "\n";

            route = nullptr;
            has_altn = false;
            return res;
        }

        route = std::make_shared<const Route>(tmp);

        DecodeErr altn_err = update_altn();
        if(altn_err != DecodeErr::SUCCESS)
        {
            std::cout << "Alternate " << altn_id << " dropped: " << 
                get_err_str(altn_err) << "\n";
            altn_id = "";
        }

        return DecodeErr::SUCCESS;
    }

    DecodeErr RouteSys::update_altn()
    {
        has_altn = false;

        if(altn_id == "")
            return DecodeErr::SUCCESS;
        if(route == nullptr || !route->get_n_legs())
            return DecodeErr::MISSING_ORIG_DEST;

        std::string id = util::str_to_upper(altn_id);
        fix_t altn_fix;
        DecodeErr err = resolve_airport(id, "", *nd_ptr, &altn_fix);
        if(err == DecodeErr::UNKNOWN_AIRPORT)
            err = resolve_wpt(id, TermScope(), *nd_ptr, &altn_fix);
        if(err != DecodeErr::SUCCESS)
            return err;

        // The final leg flown to the alternate instead
        const leg_t& last = route->get_legs().back();
        altn_leg = build_leg(last.origin, altn_fix, last.perf, get_leg_env());
        has_altn = true;

        return DecodeErr::SUCCESS;
    }
}; // namespace rtedec
