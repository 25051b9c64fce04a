#ifndef __ETL_PROFILE_H__
#define __ETL_PROFILE_H__

// meshlink - ETL host profile
// Hosted Linux build: the STL is available, exceptions are never thrown and
// container faults are routed through etl::error_handler into the log.

#define ETL_NO_EXCEPTIONS
#define ETL_LOG_ERRORS
#define ETL_VERBOSE_ERRORS
#define ETL_CHECK_PUSH_POP
#define ETL_CALLBACK_ON_ERROR

#endif
