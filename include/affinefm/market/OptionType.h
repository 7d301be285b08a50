#ifndef AFFINEFM_OPTIONTYPE_H
#define AFFINEFM_OPTIONTYPE_H

#include <string>

enum class OptionType { Call, Put };

inline std::string toString(OptionType type)
{
    return type == OptionType::Call ? "Call" : "Put";
}

#endif // AFFINEFM_OPTIONTYPE_H
