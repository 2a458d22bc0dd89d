/*
	This project is licensed under
	Creative Commons Attribution-NonCommercial-ShareAlike 4.0 International Public License (CC BY-NC-SA 4.0).

	A SUMMARY OF THIS LICENSE CAN BE FOUND HERE: https://creativecommons.org/licenses/by-nc-sa/4.0/

	Author: discord/bruh4096#4512

	This file contains small utilities shared by the route decoder.
*/

#pragma once

#include <unordered_map>
#include <string>
#include <cctype>


namespace util
{
    struct enum_class_hash_t
    {
        template <typename T>
        std::size_t operator()(T t) const
        {
            return static_cast<size_t>(t);
        }
    };

    inline std::string str_to_upper(std::string s)
    {
        for(size_t i = 0; i < s.size(); i++)
        {
            s[i] = char(toupper(static_cast<unsigned char>(s[i])));
        }
        return s;
    }

    inline bool is_digits(const std::string& s, size_t start, size_t len)
    {
        if(start + len > s.size())
            return false;
        for(size_t i = start; i < start + len; i++)
        {
            if(!isdigit(static_cast<unsigned char>(s[i])))
                return false;
        }
        return true;
    }

    inline std::string pad_int(int val, size_t width)
    {
        std::string out = std::to_string(val);
        if(out.size() < width)
            out = std::string(width - out.size(), '0') + out;
        return out;
    }

    inline bool is_alnum_str(const std::string& s)
    {
        for(size_t i = 0; i < s.size(); i++)
        {
            if(!isalnum(static_cast<unsigned char>(s[i])))
                return false;
        }
        return s.size() != 0;
    }
}; // namespace util
