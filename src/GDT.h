#ifndef _GDT_H_
#define _GDT_H_

#include <cstdint>

#include "GDTLog.h"
#include "GDTException.h"

#define GODTOOL_VERSION   "1.0.0"
#define GODTOOL_DATE      "10.19.26"

namespace GDT {

    constexpr char     NAME[]         = "GoDTool";
    constexpr char     VERSION[]      = GODTOOL_VERSION " (" GODTOOL_DATE ")";

    constexpr uint32_t DEFAULT_THREADS = 4; // When hardware concurrency can't be detected

};

#endif // _GDT_H_
