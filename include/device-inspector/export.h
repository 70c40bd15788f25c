#ifndef DEVICE_INSPECTOR_EXPORT_H
#define DEVICE_INSPECTOR_EXPORT_H

#ifdef _WIN32
#ifdef device_inspector_core_EXPORTS
#define DEVICE_INSPECTOR_API __declspec(dllexport)
#else
#define DEVICE_INSPECTOR_API __declspec(dllimport)
#endif
#else
#define DEVICE_INSPECTOR_API
#endif

#endif // DEVICE_INSPECTOR_EXPORT_H
