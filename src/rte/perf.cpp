/*
	This project is licensed under
	Creative Commons Attribution-NonCommercial-ShareAlike 4.0 International Public License (CC BY-NC-SA 4.0).

	A SUMMARY OF THIS LICENSE CAN BE FOUND HERE: https://creativecommons.org/licenses/by-nc-sa/4.0/

	Author: discord/bruh4096#4512

	This file contains definitions of performance token parsing: speed, level
    and wind, as well as the active performance snapshot.
*/

#include "perf.hpp"
#include "util.hpp"
#include <libnav/str_utils.hpp>
#include <math.h>


namespace rtedec
{
    double level_t::get_ft() const
    {
        switch(tp)
        {
        case LevelType::FL:
        case LevelType::ALT_FT:
            return double(value) * 100;
        case LevelType::METRIC_FL:
        case LevelType::ALT_M:
            return double(value) * 10 * M_TO_FT;
        }
        return 0;
    }

    double speed_t::get_tas_kts(const std::optional<level_t>& lvl) const
    {
        switch(unit)
        {
        case SpeedUnit::KNOTS:
            return value;
        case SpeedUnit::KMH:
            return value / 1.852;
        case SpeedUnit::MACH:
            {
                double alt_ft = 0;
                if(lvl.has_value())
                    alt_ft = lvl.value().get_ft();
                double temp_k = ISA_SL_TEMP_K - ISA_LAPSE_K_FT * alt_ft;
                if(temp_k < ISA_TROP_TEMP_K)
                    temp_k = ISA_TROP_TEMP_K;
                return value * ISA_SL_SOUND_KTS * sqrt(temp_k / ISA_SL_TEMP_K);
            }
        }
        return 0;
    }

    bool operator==(speed_t const& a, speed_t const& b)
    {
        return a.unit == b.unit && a.value == b.value;
    }

    bool operator==(level_t const& a, level_t const& b)
    {
        return a.tp == b.tp && a.value == b.value;
    }

    bool operator==(wind_t const& a, wind_t const& b)
    {
        return a.dir_deg == b.dir_deg && a.spd_kts == b.spd_kts;
    }

    bool operator==(perf_snapshot_t const& a, perf_snapshot_t const& b)
    {
        return a.spd == b.spd && a.lvl == b.lvl && a.wind == b.wind;
    }

    bool parse_speed(const std::string& tok, speed_t *out)
    {
        if(tok.size() < 4)
            return false;

        size_t n_digits = tok.size() - 1;
        if(!util::is_digits(tok, 1, n_digits))
            return false;

        int val = strutils::stoi_with_strip(tok.substr(1, n_digits));

        if((tok[0] == 'K' || tok[0] == 'N') && n_digits == 4)
        {
            SpeedUnit unit = SpeedUnit::KNOTS;
            if(tok[0] == 'K')
                unit = SpeedUnit::KMH;
            *out = {unit, double(val)};
            return true;
        }
        if(tok[0] == 'M' && n_digits == 3)
        {
            *out = {SpeedUnit::MACH, double(val) / 100};
            return true;
        }
        return false;
    }

    bool parse_level(const std::string& tok, level_t *out)
    {
        if(tok.size() < 4)
            return false;

        size_t n_digits = tok.size() - 1;
        if(!util::is_digits(tok, 1, n_digits))
            return false;

        int val = strutils::stoi_with_strip(tok.substr(1, n_digits));

        switch(tok[0])
        {
        case 'F':
            if(n_digits != 3)
                return false;
            *out = {LevelType::FL, val};
            return true;
        case 'A':
            if(n_digits != 3)
                return false;
            *out = {LevelType::ALT_FT, val};
            return true;
        case 'S':
            // ICAO allows S + 4 digits as well
            if(n_digits != 3 && n_digits != 4)
                return false;
            *out = {LevelType::METRIC_FL, val};
            return true;
        case 'M':
            if(n_digits != 4)
                return false;
            *out = {LevelType::ALT_M, val};
            return true;
        default:
            return false;
        }
    }

    bool parse_wind(const std::string& tok, wind_t *out)
    {
        // dddssKT or dddsssKT
        if(tok.size() != 7 && tok.size() != 8)
            return false;
        if(tok.substr(tok.size() - WIND_SUFFIX.size()) != WIND_SUFFIX)
            return false;

        size_t n_digits = tok.size() - WIND_SUFFIX.size();
        if(!util::is_digits(tok, 0, n_digits))
            return false;

        int dir = strutils::stoi_with_strip(tok.substr(0, 3));
        int spd = strutils::stoi_with_strip(tok.substr(3, n_digits - 3));
        if(dir > WIND_DIR_MAX_DEG)
            return false;

        *out = {dir, spd};
        return true;
    }

    bool is_perf_like(const std::string& tok)
    {
        if(tok.size() > WIND_SUFFIX.size() && 
            tok.substr(tok.size() - WIND_SUFFIX.size()) == WIND_SUFFIX &&
            util::is_digits(tok, 0, 3))
        {
            return true;
        }

        if(tok.size() < 3)
            return false;

        std::string perf_letters = "KNMFSA";
        if(perf_letters.find(tok[0]) == std::string::npos)
            return false;

        return util::is_digits(tok, 1, 1) && util::is_alnum_str(tok);
    }

    std::string speed_to_str(speed_t spd)
    {
        switch(spd.unit)
        {
        case SpeedUnit::KNOTS:
            return "N" + util::pad_int(int(round(spd.value)), 4);
        case SpeedUnit::KMH:
            return "K" + util::pad_int(int(round(spd.value)), 4);
        case SpeedUnit::MACH:
            return "M" + util::pad_int(int(round(spd.value * 100)), 3);
        }
        return "";
    }

    std::string level_to_str(level_t lvl)
    {
        switch(lvl.tp)
        {
        case LevelType::FL:
            return "F" + util::pad_int(lvl.value, 3);
        case LevelType::METRIC_FL:
            return "S" + util::pad_int(lvl.value, 3);
        case LevelType::ALT_FT:
            return "A" + util::pad_int(lvl.value, 3);
        case LevelType::ALT_M:
            return "M" + util::pad_int(lvl.value, 4);
        }
        return "";
    }

    std::string wind_to_str(wind_t wind)
    {
        return util::pad_int(wind.dir_deg, 3) + util::pad_int(wind.spd_kts, 2) + 
            WIND_SUFFIX;
    }

    // PerfInterp member function definitions:

    // Public member functions:

    PerfInterp::PerfInterp()
    {
        curr = {};
    }

    bool PerfInterp::apply(const std::string& tok)
    {
        speed_t spd;
        level_t lvl;
        wind_t wind;

        if(parse_wind(tok, &wind))
        {
            curr.wind = wind;
            return true;
        }
        if(parse_speed(tok, &spd))
        {
            curr.spd = spd;
            if(!crz_spd.has_value())
                crz_spd = spd;
            return true;
        }
        if(parse_level(tok, &lvl))
        {
            curr.lvl = lvl;
            if(!crz_lvl.has_value())
                crz_lvl = lvl;
            return true;
        }
        return false;
    }

    perf_snapshot_t PerfInterp::get_snapshot() const
    {
        return curr;
    }

    std::optional<speed_t> PerfInterp::get_cruise_spd() const
    {
        return crz_spd;
    }

    std::optional<level_t> PerfInterp::get_cruise_lvl() const
    {
        return crz_lvl;
    }
}; // namespace rtedec
