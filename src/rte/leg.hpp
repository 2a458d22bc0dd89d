/*
	This project is licensed under
	Creative Commons Attribution-NonCommercial-ShareAlike 4.0 International Public License (CC BY-NC-SA 4.0).

	A SUMMARY OF THIS LICENSE CAN BE FOUND HERE: https://creativecommons.org/licenses/by-nc-sa/4.0/

	Author: discord/bruh4096#4512

	This file contains declarations of route legs and the leg builder.
*/

#pragma once

#include "fix_resolver.hpp"
#include "perf.hpp"
#include "nav/magvar.hpp"
#include <ctime>
#include <memory>
#include <optional>
#include <vector>


namespace rtedec
{
    class CruiseProfile
    {
    public:
        virtual ~CruiseProfile() = default;

        /*
            Function: get_fuel_flow
            Description:
            Gets cruise fuel flow per hour.
            @param lvl: active level, absent if none was given
            @param out: pointer to output fuel flow
            @return true if the profile covers this level
        */

        virtual bool get_fuel_flow(const std::optional<level_t>& lvl, 
            double *out) const = 0;
    };

    // Same fuel flow at every level
    class ConstFFProfile: public CruiseProfile
    {
    public:
        ConstFFProfile(double ff_per_hr);

        bool get_fuel_flow(const std::optional<level_t>& lvl, 
            double *out) const override;

    private:
        double ff;
    };


    struct leg_env_t
    {
        std::shared_ptr<CruiseProfile> profile;
        std::optional<std::time_t> date;
        std::shared_ptr<MagVarModel> magvar;  // SGMagVarModel if null
    };

    struct leg_t
    {
        fix_t origin, dest;
        perf_snapshot_t perf;
        double true_crs_deg, dist_nm;

        std::optional<double> wca_deg;
        std::optional<double> gs_kts;
        std::optional<double> hdg_deg;  // True
        std::optional<double> ete_hr;
        std::optional<double> fuel;
        std::optional<double> mag_crs_deg;
        std::optional<double> mag_hdg_deg;
    };

    // A fix together with the performance in force when it was reached
    struct fix_entry_t
    {
        fix_t fix;
        perf_snapshot_t perf;
    };


    leg_t build_leg(const fix_t& origin, const fix_t& dest, const perf_snapshot_t& perf,
        const leg_env_t& env);

    /*
        Function: build_legs
        Description:
        Chains consecutive fixes into legs. Every leg carries the performance
        snapshot of its destination entry.
        @param fixes: resolved fixes in route order
        @param env: external inputs for fuel and magnetic course
        @param out: pointer to vector that receives the legs
        @return DecodeErr::MISSING_ORIG_DEST if there are fewer than 2 fixes
    */

    DecodeErr build_legs(const std::vector<fix_entry_t>& fixes, const leg_env_t& env,
        std::vector<leg_t> *out);
}; // namespace rtedec
