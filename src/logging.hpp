#ifndef __ONVIFCORE_LOGGING_H__
#define __ONVIFCORE_LOGGING_H__

#include "CommonTypes.hpp"
#include <sstream>

/// Format m with operator<< and hand it to log callback cb at level l, if cb is set.
#define ONVIFCORE_LOG(cb,l,m)                           \
     do                                                 \
     {                                                  \
         if (cb) {                                      \
             std::stringstream ss {};                   \
             ss << m;                                   \
             cb(ss.str(), l);                           \
         }                                              \
     } while(false)

#endif // __ONVIFCORE_LOGGING_H__
