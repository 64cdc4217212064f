#ifndef TURN_COORDINATOR_EXPORT_H
#define TURN_COORDINATOR_EXPORT_H

#ifdef _WIN32
#ifdef turn_coordinator_core_EXPORTS
#define TURN_COORDINATOR_API __declspec(dllexport)
#else
#define TURN_COORDINATOR_API __declspec(dllimport)
#endif
#else
#define TURN_COORDINATOR_API
#endif

#endif // TURN_COORDINATOR_EXPORT_H
