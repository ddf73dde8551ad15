#ifndef SQUIRCLE_VERSION_H_
#define SQUIRCLE_VERSION_H_

constexpr auto SQUIRCLE_VERSION = "1.0.0";

#endif // SQUIRCLE_VERSION_H_
