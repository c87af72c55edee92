#pragma once

#include <algorithm>
#include <string>
using namespace std;

/**
 *  @brief  Value following a command line option.
 *  @return 0 if the option is absent or has no value (end of line, or another option next).
*/
inline const char* getCmdOption(char ** begin, char ** end, const string& option)
{
    char ** itr = std::find(begin, end, option);
    if (itr == end || ++itr == end)
        return 0;
    if ((*itr)[0] == '-' && (*itr)[1] != '\0')
        return 0;
    return *itr;
}

inline bool cmdOptionExists(char** begin, char** end, const string& option)
{
    return std::find(begin, end, option) != end;
}

/* Option given on the command line but without its value */
inline bool cmdOptionMissingValue(char** begin, char** end, const string& option)
{
    return cmdOptionExists(begin, end, option) && getCmdOption(begin, end, option) == 0;
}
