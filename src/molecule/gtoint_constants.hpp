#ifndef MOLEC_CONSTANTS_H
#define MOLEC_CONSTANTS_H
namespace MOLEC_CONSTANTS
{
    constexpr double angstrom_to_bohr{1.8897261254535};
}

#endif
