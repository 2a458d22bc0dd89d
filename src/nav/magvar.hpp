/*
	This project is licensed under
	Creative Commons Attribution-NonCommercial-ShareAlike 4.0 International Public License (CC BY-NC-SA 4.0).

	A SUMMARY OF THIS LICENSE CAN BE FOUND HERE: https://creativecommons.org/licenses/by-nc-sa/4.0/

	Author: discord/bruh4096#4512

	This file contains declarations of magnetic variation models.
*/

#pragma once

#include <libnav/geo_utils.hpp>
#include <ctime>


namespace rtedec
{
    constexpr double UNIX_EPOCH_JD = 2440587.5;
    constexpr double SEC_PER_DAY = 86400;


    inline double get_julian_date(std::time_t t)
    {
        return double(t) / SEC_PER_DAY + UNIX_EPOCH_JD;
    }


    class MagVarModel
    {
    public:
        virtual ~MagVarModel() = default;

        // Returns variation in degrees, east positive
        virtual double get_magvar_deg(geo::point pos, double jd) const = 0;
    };

    // World magnetic model as shipped with SimGear
    class SGMagVarModel: public MagVarModel
    {
    public:
        double get_magvar_deg(geo::point pos, double jd) const override;
    };
}; // namespace rtedec
