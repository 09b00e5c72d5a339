#ifndef SYNCAUDIT_VERSION_HPP
#define SYNCAUDIT_VERSION_HPP

#define SYNCAUDIT_VERSION_MAJOR 0
#define SYNCAUDIT_VERSION_MINOR 3
#define SYNCAUDIT_VERSION_PATCH 0

#define SYNCAUDIT_VERSION_STR "0.3.0"

constexpr const char* SYNCAUDIT_VERSION = SYNCAUDIT_VERSION_STR;

#endif // SYNCAUDIT_VERSION_HPP
