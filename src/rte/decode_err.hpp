/*
	This project is licensed under
	Creative Commons Attribution-NonCommercial-ShareAlike 4.0 International Public License (CC BY-NC-SA 4.0).

	A SUMMARY OF THIS LICENSE CAN BE FOUND HERE: https://creativecommons.org/licenses/by-nc-sa/4.0/

	Author: discord/bruh4096#4512

	This file contains route decoder error codes.
*/

#pragma once

#include "util.hpp"
#include <string>


namespace rtedec
{
    constexpr size_t ERR_POS_NONE = size_t(-1);


    enum class DecodeErr
    {
        SUCCESS,
        EMPTY_ROUTE,
        INVALID_TOKEN,
        INVALID_PERF_FORMAT,
        UNKNOWN_AIRPORT,
        INVALID_RUNWAY,
        UNKNOWN_WPT,
        AMBIGUOUS_WPT,
        MISSING_ORIG_DEST
    };

    const std::unordered_map<DecodeErr, std::string, util::enum_class_hash_t> 
        DECODE_ERR_NAMES = {
            {DecodeErr::SUCCESS, "SUCCESS"},
            {DecodeErr::EMPTY_ROUTE, "EMPTY ROUTE"},
            {DecodeErr::INVALID_TOKEN, "INVALID TOKEN"},
            {DecodeErr::INVALID_PERF_FORMAT, "INVALID PERFORMANCE FORMAT"},
            {DecodeErr::UNKNOWN_AIRPORT, "UNKNOWN AIRPORT"},
            {DecodeErr::INVALID_RUNWAY, "INVALID RUNWAY"},
            {DecodeErr::UNKNOWN_WPT, "UNKNOWN WAYPOINT"},
            {DecodeErr::AMBIGUOUS_WPT, "AMBIGUOUS WAYPOINT"},
            {DecodeErr::MISSING_ORIG_DEST, "MISSING ORIGIN OR DESTINATION"}
        };


    struct err_info_t
    {
        DecodeErr err;
        std::string token;
        size_t pos;  // Index of the token in the route. ERR_POS_NONE if not tied to one
    };


    inline std::string get_err_str(DecodeErr err)
    {
        auto it = DECODE_ERR_NAMES.find(err);
        if(it == DECODE_ERR_NAMES.end())
            return "UNKNOWN ERROR";
        return it->second;
    }

    inline DecodeErr set_err(err_info_t *out, DecodeErr err, std::string token="", 
        size_t pos=ERR_POS_NONE)
    {
        if(out != nullptr)
            *out = {err, token, pos};
        return err;
    }
}; // namespace rtedec
