#ifndef POD_VALIDATOR_EXPORT_H
#define POD_VALIDATOR_EXPORT_H

// The core library is built static; POD_VALIDATOR_STATIC is set on it and
// propagated to every consumer, so nothing is imported from a DLL.
#if defined(_WIN32) && !defined(POD_VALIDATOR_STATIC)
#ifdef pod_validator_core_EXPORTS
#define POD_VALIDATOR_API __declspec(dllexport)
#else
#define POD_VALIDATOR_API __declspec(dllimport)
#endif
#else
#define POD_VALIDATOR_API
#endif

#endif // POD_VALIDATOR_EXPORT_H
