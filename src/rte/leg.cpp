/*
	This project is licensed under
	Creative Commons Attribution-NonCommercial-ShareAlike 4.0 International Public License (CC BY-NC-SA 4.0).

	A SUMMARY OF THIS LICENSE CAN BE FOUND HERE: https://creativecommons.org/licenses/by-nc-sa/4.0/

	Author: discord/bruh4096#4512

	This file contains definitions of route legs and the leg builder.
*/

#include "leg.hpp"
#include "geom.hpp"


namespace rtedec
{
    // ConstFFProfile member function definitions:

    ConstFFProfile::ConstFFProfile(double ff_per_hr)
    {
        ff = ff_per_hr;
    }

    bool ConstFFProfile::get_fuel_flow(const std::optional<level_t>& lvl, 
        double *out) const
    {
        (void)lvl;
        *out = ff;
        return true;
    }


    leg_t build_leg(const fix_t& origin, const fix_t& dest, const perf_snapshot_t& perf,
        const leg_env_t& env)
    {
        leg_t out;
        out.origin = origin;
        out.dest = dest;
        out.perf = perf;

        geo::point p_orig = origin.pos;
        double crs_rad = p_orig.get_gc_bearing_rad(dest.pos);
        out.true_crs_deg = geom::normalize_deg(crs_rad * geom::RAD_TO_DEG);
        out.dist_nm = p_orig.get_gc_dist_nm(dest.pos);

        if(perf.spd.has_value() && perf.wind.has_value())
        {
            double tas_kts = perf.spd.value().get_tas_kts(perf.lvl);
            wind_t wind = perf.wind.value();
            geom::vect2_t wind_vect = geom::get_wind_vect(
                double(wind.dir_deg) * geom::DEG_TO_RAD, double(wind.spd_kts));

            double wca_rad = 0;
            double gs_kts = 0;
            if(geom::solve_wind_triangle(out.true_crs_deg * geom::DEG_TO_RAD, tas_kts, 
                wind_vect, &wca_rad, &gs_kts))
            {
                out.wca_deg = wca_rad * geom::RAD_TO_DEG;
                out.gs_kts = gs_kts;
                out.hdg_deg = geom::normalize_deg(out.true_crs_deg + out.wca_deg.value());
                out.ete_hr = out.dist_nm / gs_kts;

                double ff = 0;
                if(env.profile != nullptr && env.profile->get_fuel_flow(perf.lvl, &ff))
                    out.fuel = ff * out.ete_hr.value();
            }
        }

        if(env.date.has_value())
        {
            double jd = get_julian_date(env.date.value());
            double var_deg = 0;
            if(env.magvar != nullptr)
            {
                var_deg = env.magvar->get_magvar_deg(origin.pos, jd);
            }
            else
            {
                SGMagVarModel wmm;
                var_deg = wmm.get_magvar_deg(origin.pos, jd);
            }
            out.mag_crs_deg = geom::normalize_deg(out.true_crs_deg - var_deg);
            if(out.hdg_deg.has_value())
                out.mag_hdg_deg = geom::normalize_deg(out.hdg_deg.value() - var_deg);
        }

        return out;
    }

    DecodeErr build_legs(const std::vector<fix_entry_t>& fixes, const leg_env_t& env,
        std::vector<leg_t> *out)
    {
        out->clear();

        if(fixes.size() < 2)
            return DecodeErr::MISSING_ORIG_DEST;

        for(size_t i = 1; i < fixes.size(); i++)
        {
            out->push_back(build_leg(fixes[i-1].fix, fixes[i].fix, fixes[i].perf, env));
        }

        return DecodeErr::SUCCESS;
    }
}; // namespace rtedec
