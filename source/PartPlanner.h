// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#ifndef PARTPLANNER_H_
#define PARTPLANNER_H_

#include "UploadConfig.h"
#include "UploadSession.h"


/**
 * Result of part planning. No parts means single-shot upload.
 */
struct PartPlan
{
	uint64_t chunkSize{0}; // 0 for single-shot
	unsigned concurrency{1};
	PartRecordVec parts;
};


/**
 * Splits a file of given size into the ordered list of parts according to the configured size
 * policy and backend limits.
 */
class PartPlanner
{
	public:
		explicit PartPlanner(const UploadConfig& config) : config(config) {}

		void plan(uint64_t totalSize, uint64_t chunkSizeOverride, unsigned concurrencyOverride,
			PartPlan& outPlan) const;

	private:
		const UploadConfig& config;

		void checkPlan(uint64_t totalSize, uint64_t chunkSize, uint64_t numParts) const;
};


#endif /* PARTPLANNER_H_ */
