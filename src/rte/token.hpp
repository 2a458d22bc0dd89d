/*
	This project is licensed under
	Creative Commons Attribution-NonCommercial-ShareAlike 4.0 International Public License (CC BY-NC-SA 4.0).

	A SUMMARY OF THIS LICENSE CAN BE FOUND HERE: https://creativecommons.org/licenses/by-nc-sa/4.0/

	Author: discord/bruh4096#4512

	This file contains declarations of the route string scanner.
*/

#pragma once

#include "decode_err.hpp"
#include <string>
#include <vector>


namespace rtedec
{
    const std::string VIA_DCT = "DCT";

    constexpr size_t ICAO_LEN = 4;
    constexpr size_t WPT_ID_MAX_LEN = 5;
    constexpr size_t RWY_DIGITS_MAX = 2;


    enum class TokenShape
    {
        VIA,
        SPEED,
        LEVEL,
        WIND,
        PERF_MALFORMED,  // Looks like performance data but isn't valid
        AIRPORT_RWY,     // ICAO followed by runway designator
        IDENT,           // Airport or waypoint identifier
        INVALID
    };

    struct token_t
    {
        std::string text;
        size_t pos;
    };


    /*
        Function: scan_route
        Description:
        Splits a route string into upper case tokens on runs of whitespace.
        @param rte: route string
        @param out: pointer to vector that receives the tokens
        @param err: optional error info
        @return DecodeErr::EMPTY_ROUTE if there are no tokens
    */

    DecodeErr scan_route(const std::string& rte, std::vector<token_t> *out,
        err_info_t *err=nullptr);

    TokenShape get_token_shape(const std::string& tok);

    bool is_rwy_designator(const std::string& s);

    /*
        Splits an AIRPORT_RWY shaped token or a 5 character identifier
        into ICAO code and runway designator.
    */
    bool split_arpt_rwy(const std::string& tok, std::string *icao, std::string *rwy);
}; // namespace rtedec
