// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#include <cctype>
#include <iomanip>
#include <limits>
#include <sstream>
#include "ProgException.h"
#include "UnitTk.h"

/**
 * Convert a human byte string with binary unit at the end (e.g. "8M" or "1G") to bytes.
 *
 * @param throwOnEmpty true to throw an exception if numHuman is empty, false to return 0 in this
 * 		case.
 * @throw ProgException if string cannot be parsed or result doesn't fit into 64bit.
 */
uint64_t UnitTk::numHumanToBytesBinary(std::string numHuman, bool throwOnEmpty)
{
	if(numHuman.empty() )
	{
		if(throwOnEmpty)
			throw ProgException("Unable to parse empty string");
		else
			return 0;
	}

	// allow "MiB" and "MB" style suffixes, which both mean base 2 here
	if( (numHuman.length() > 1) && (std::toupper(numHuman.back() ) == 'B') )
		numHuman.pop_back();
	if( (numHuman.length() > 1) && (std::tolower(numHuman.back() ) == 'i') )
		numHuman.pop_back();

	size_t numDigits = 0;
	while( (numDigits < numHuman.length() ) && std::isdigit(numHuman[numDigits] ) )
		numDigits++;

	if(!numDigits)
		throw ProgException("Unable to parse number string without leading digits: " + numHuman);

	if(numHuman.length() > (numDigits + 1) )
		throw ProgException("Unable to parse number string with trailing characters: " +
			numHuman);

	uint64_t bytesRes;

	try
	{
		bytesRes = std::stoull(numHuman.substr(0, numDigits) );
	}
	catch(std::out_of_range& e)
	{
		throw ProgException("Number string out of range: " + numHuman);
	}

	if(numDigits == numHuman.length() )
		return bytesRes; // no unit found at end, so nothing to convert

	unsigned shiftBits;

	switch(std::toupper(numHuman.back() ) )
	{
		case 'K': shiftBits = 10; break;
		case 'M': shiftBits = 20; break;
		case 'G': shiftBits = 30; break;
		case 'T': shiftBits = 40; break;
		case 'P': shiftBits = 50; break;
		case 'E': shiftBits = 60; break;

		default: throw ProgException("Unable to parse string for unit conversion: " +
			numHuman);
	}

	if(bytesRes > (std::numeric_limits<uint64_t>::max() >> shiftBits) )
		throw ProgException("Number string out of range: " + numHuman);

	return bytesRes << shiftBits;
}

/**
 * Convert number of bytes to a human readable string with binary unit suffix.
 *
 * Output examples:
 * 123B
 * 8.0MiB
 * 1.5GiB
 */
std::string UnitTk::bytesToHumanStrBinary(uint64_t numBytes)
{
	const char* unitSuffixes[] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB", "EiB"};
	const unsigned numUnits = sizeof(unitSuffixes) / sizeof(unitSuffixes[0] );

	if(numBytes < 1024)
		return std::to_string(numBytes) + unitSuffixes[0];

	double value = numBytes;
	unsigned unitIndex = 0;

	while( (value >= 1024) && (unitIndex < (numUnits - 1) ) )
	{
		value /= 1024;
		unitIndex++;
	}

	std::ostringstream resultStream;
	resultStream << std::fixed << std::setprecision(1) << value << unitSuffixes[unitIndex];

	return resultStream.str();
}

/**
 * Convert elapsed time in seconds to human readable string with suffix.
 *
 * Output examples:
 * 12s
 * 2m3s
 * 1h0m0s
 * 3h25m45s
 */
std::string UnitTk::elapsedSecToHumanStr(uint64_t elapsedSec)
{
	size_t numHours = elapsedSec / 3600;
	size_t numMin = (elapsedSec % 3600) / 60;
	size_t numSec = elapsedSec % 60;

	std::ostringstream resultStream;

	if(numHours)
		resultStream << numHours << "h" << numMin << "m" << numSec << "s";
	else
	if(numMin)
		resultStream << numMin << "m" << numSec << "s";
	else
		resultStream << numSec << "s";

	return resultStream.str();
}
