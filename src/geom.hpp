/*
	This project is licensed under
	Creative Commons Attribution-NonCommercial-ShareAlike 4.0 International Public License (CC BY-NC-SA 4.0).

	A SUMMARY OF THIS LICENSE CAN BE FOUND HERE: https://creativecommons.org/licenses/by-nc-sa/4.0/

	This header file contains definitions of utility functions for geometry. 
    Mostly vectors. Wind triangle helpers are also included.
    Author: discord/bruh4096#4512(Tim G.)
*/


#pragma once

#define _USE_MATH_DEFINES
#include <math.h>
#include <libnav/geo_utils.hpp>


namespace geom
{
    constexpr double DEG_TO_RAD = M_PI / 180.0;
	constexpr double RAD_TO_DEG = 180.0 / M_PI;


    // x points east, y points north
    struct vect2_t
    {
        double x, y;


        double dot_prod(vect2_t other)
        {
            return x * other.x + y * other.y;
        }

        vect2_t scmul(double num)
        {
            return {x * num, y * num};
        }
    };


    inline double normalize_deg(double ang_deg)
    {
        double out = fmod(ang_deg, 360.0);
        if(out < 0)
            out += 360;
        return out;
    }

    /*
        Function: get_brng_vect
        Description:
        Gets unit vector pointing along a true bearing.
        @param brng_rad: bearing in radians, clockwise from north
        @return unit vector
    */

    inline vect2_t get_brng_vect(double brng_rad)
    {
        return {sin(brng_rad), cos(brng_rad)};
    }

    /*
        Function: get_wind_vect
        Description:
        Gets the vector the air mass moves along. Wind direction is the
        direction the wind blows from.
        @param dir_from_rad: wind direction in radians
        @param spd: wind speed
        @return wind vector
    */

    inline vect2_t get_wind_vect(double dir_from_rad, double spd)
    {
        return get_brng_vect(dir_from_rad).scmul(-spd);
    }

    /*
        Function: solve_wind_triangle
        Description:
        Finds wind correction angle and ground speed needed to hold a course.
        @param crs_rad: true course in radians
        @param tas: true airspeed
        @param wind: wind vector(see get_wind_vect), same units as tas
        @param wca_rad: output for the wind correction angle. Positive is right.
        @param gs: output for the ground speed
        @return true if the course can be held with positive ground speed
    */

    inline bool solve_wind_triangle(double crs_rad, double tas, vect2_t wind,
        double *wca_rad, double *gs)
    {
        if(tas <= 0)
            return false;

        vect2_t trk = get_brng_vect(crs_rad);
        vect2_t nml = {trk.y, -trk.x}; // Right of track

        double xwind = nml.dot_prod(wind);
        if(fabs(xwind) > tas)
            return false;

        double wca = asin(-xwind / tas);
        double spd = tas * cos(wca) + trk.dot_prod(wind);
        if(spd <= 0)
            return false;

        *wca_rad = wca;
        *gs = spd;
        return true;
    }
}; // namespace geom
