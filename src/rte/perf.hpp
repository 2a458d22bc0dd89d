/*
	This project is licensed under
	Creative Commons Attribution-NonCommercial-ShareAlike 4.0 International Public License (CC BY-NC-SA 4.0).

	A SUMMARY OF THIS LICENSE CAN BE FOUND HERE: https://creativecommons.org/licenses/by-nc-sa/4.0/

	Author: discord/bruh4096#4512

	This file contains declarations of performance token parsing: speed, level
    and wind, as well as the active performance snapshot.
*/

#pragma once

#include <optional>
#include <string>


namespace rtedec
{
    constexpr double M_TO_FT = 3.28084;
    constexpr double ISA_SL_TEMP_K = 288.15;
    constexpr double ISA_TROP_TEMP_K = 216.65;
    constexpr double ISA_LAPSE_K_FT = 0.0019812;
    constexpr double ISA_SL_SOUND_KTS = 661.4788;
    constexpr int WIND_DIR_MAX_DEG = 360;

    const std::string WIND_SUFFIX = "KT";


    enum class SpeedUnit
    {
        KNOTS,
        KMH,
        MACH
    };

    enum class LevelType
    {
        FL,         // F: hundreds of feet, standard pressure
        METRIC_FL,  // S: tens of meters, standard pressure
        ALT_FT,     // A: hundreds of feet
        ALT_M       // M: tens of meters
    };

    struct level_t
    {
        LevelType tp;
        int value;


        double get_ft() const;
    };

    struct speed_t
    {
        SpeedUnit unit;
        double value;


        /*
            Function: get_tas_kts
            Description:
            Converts the speed to true airspeed in knots. Mach uses the ISA
            speed of sound at the level given.
            @param lvl: active level. Sea level is used when absent
            @return true airspeed in knots
        */

        double get_tas_kts(const std::optional<level_t>& lvl) const;
    };

    struct wind_t
    {
        int dir_deg;  // Direction the wind blows from, true
        int spd_kts;
    };

    struct perf_snapshot_t
    {
        std::optional<speed_t> spd;
        std::optional<level_t> lvl;
        std::optional<wind_t> wind;
    };


    bool operator==(speed_t const& a, speed_t const& b);
    bool operator==(level_t const& a, level_t const& b);
    bool operator==(wind_t const& a, wind_t const& b);
    bool operator==(perf_snapshot_t const& a, perf_snapshot_t const& b);

    bool parse_speed(const std::string& tok, speed_t *out);

    bool parse_level(const std::string& tok, level_t *out);

    bool parse_wind(const std::string& tok, wind_t *out);

    /*
        Function: is_perf_like
        Description:
        Checks whether a token looks like a performance token without 
        necessarily being a valid one: a speed/level letter followed by
        a digit, or a wind group with bad digits or range.
        @param tok: upper case token
        @return true if token has the outline of a performance token
    */

    bool is_perf_like(const std::string& tok);

    std::string speed_to_str(speed_t spd);

    std::string level_to_str(level_t lvl);

    std::string wind_to_str(wind_t wind);


    class PerfInterp
    {
    public:
        PerfInterp();

        /*
            Function: apply
            Description:
            Overrides the matching field of the active snapshot if tok is a
            valid speed, level or wind.
            @param tok: upper case token
            @return true if tok was consumed
        */

        bool apply(const std::string& tok);

        perf_snapshot_t get_snapshot() const;

        std::optional<speed_t> get_cruise_spd() const;

        std::optional<level_t> get_cruise_lvl() const;

    private:
        perf_snapshot_t curr;
        std::optional<speed_t> crz_spd;
        std::optional<level_t> crz_lvl;
    };
}; // namespace rtedec
