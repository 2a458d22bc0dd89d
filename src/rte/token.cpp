/*
	This project is licensed under
	Creative Commons Attribution-NonCommercial-ShareAlike 4.0 International Public License (CC BY-NC-SA 4.0).

	A SUMMARY OF THIS LICENSE CAN BE FOUND HERE: https://creativecommons.org/licenses/by-nc-sa/4.0/

	Author: discord/bruh4096#4512

	This file contains definitions of the route string scanner.
*/

#include "token.hpp"
#include "perf.hpp"
#include "util.hpp"
#include <cctype>


namespace rtedec
{
    DecodeErr scan_route(const std::string& rte, std::vector<token_t> *out,
        err_info_t *err)
    {
        out->clear();

        std::string curr;
        for(size_t i = 0; i <= rte.size(); i++)
        {
            if(i == rte.size() || isspace(static_cast<unsigned char>(rte[i])))
            {
                if(curr.size())
                {
                    out->push_back({util::str_to_upper(curr), out->size()});
                    curr.clear();
                }
            }
            else
            {
                curr.push_back(rte[i]);
            }
        }

        if(!out->size())
            return set_err(err, DecodeErr::EMPTY_ROUTE);
        return set_err(err, DecodeErr::SUCCESS);
    }

    TokenShape get_token_shape(const std::string& tok)
    {
        if(tok == VIA_DCT)
            return TokenShape::VIA;

        speed_t spd;
        level_t lvl;
        wind_t wind;
        if(parse_wind(tok, &wind))
            return TokenShape::WIND;
        if(parse_speed(tok, &spd))
            return TokenShape::SPEED;
        if(parse_level(tok, &lvl))
            return TokenShape::LEVEL;
        if(is_perf_like(tok))
            return TokenShape::PERF_MALFORMED;

        if(!util::is_alnum_str(tok))
            return TokenShape::INVALID;
        if(tok.size() <= WPT_ID_MAX_LEN)
            return TokenShape::IDENT;

        std::string icao, rwy;
        if(split_arpt_rwy(tok, &icao, &rwy))
            return TokenShape::AIRPORT_RWY;
        return TokenShape::INVALID;
    }

    bool is_rwy_designator(const std::string& s)
    {
        size_t n_digits = 0;
        while(n_digits < s.size() && isdigit(static_cast<unsigned char>(s[n_digits])))
            n_digits++;

        if(n_digits == 0 || n_digits > RWY_DIGITS_MAX)
            return false;
        if(n_digits == s.size())
            return true;

        return n_digits + 1 == s.size() && 
            (s.back() == 'L' || s.back() == 'R' || s.back() == 'C');
    }

    bool split_arpt_rwy(const std::string& tok, std::string *icao, std::string *rwy)
    {
        if(tok.size() <= ICAO_LEN)
            return false;

        std::string id = tok.substr(0, ICAO_LEN);
        std::string des = tok.substr(ICAO_LEN);
        if(!util::is_alnum_str(id) || !is_rwy_designator(des))
            return false;

        *icao = id;
        *rwy = des;
        return true;
    }
}; // namespace rtedec
