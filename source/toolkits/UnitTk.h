// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#ifndef TOOLKITS_UNITTK_H_
#define TOOLKITS_UNITTK_H_

#include <cstdint>
#include <string>


/**
 * Toolkit to convert units (e.g. bytes to mebibytes).
 */
class UnitTk
{
	public:
		static uint64_t numHumanToBytesBinary(std::string numHuman, bool throwOnEmpty);
		static std::string bytesToHumanStrBinary(uint64_t numBytes);
		static std::string elapsedSecToHumanStr(uint64_t elapsedSec);

	private:
		UnitTk() {}

	// inliners
	public:
		/**
		 * Calculate per second values from total values based on given elapsed time.
		 *
		 * @totalValue total value for which to calc per-sec value based on elapsedMS.
		 * @elapsedMS elapsed time as basis for per-sec calculation.
		 * @return per-sec value based on totalValue and elapsedMS; 0 if elapsedMS is 0.
		 */
		static uint64_t getPerSecFromMS(uint64_t totalValue, uint64_t elapsedMS)
		{
			if(!elapsedMS)
				return 0;

			// (floating to avoid overflow of totalValue*1000)
			return totalValue * (1000.0 / elapsedMS);
		}
};

#endif /* TOOLKITS_UNITTK_H_ */
