/*
	This project is licensed under
	Creative Commons Attribution-NonCommercial-ShareAlike 4.0 International Public License (CC BY-NC-SA 4.0).

	A SUMMARY OF THIS LICENSE CAN BE FOUND HERE: https://creativecommons.org/licenses/by-nc-sa/4.0/

	Author: discord/bruh4096#4512

	This file contains definitions of magnetic variation models.
*/

#include "magvar.hpp"
#include <simgear/magvar/magvar.hxx>


namespace rtedec
{
    double SGMagVarModel::get_magvar_deg(geo::point pos, double jd) const
    {
        return sgGetMagVar(pos.lon_rad, pos.lat_rad, 0, jd) * geo::RAD_TO_DEG;
    }
}; // namespace rtedec
