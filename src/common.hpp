#pragma once
#ifndef HGSPIN_COMMON_HPP
#define HGSPIN_COMMON_HPP

#include <array>
#include <vector>
#include <string>
#include <boost/random/mersenne_twister.hpp>
using namespace std;

// Choose the appropriate Mersenne Twister engine for random number generation on 32-bit or 64-bit platform.
#if defined(__x86_64) || defined(__x86_64__) || defined(__amd64) || defined(__amd64__) || defined(_M_X64) || defined(_M_AMD64)
typedef boost::random::mt19937_64 mt19937eng;
#else
typedef boost::random::mt19937 mt19937eng;
#endif

//! Represents the coordinates of a set of atoms, one row of x, y and z per atom.
typedef vector<array<double, 3>> position_matrix;

#endif
