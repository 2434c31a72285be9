// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#include "Logger.h"
#include "PartPlanner.h"
#include "ProgException.h"
#include "UploadException.h"


/**
 * Compute chunk size, concurrency and parts for a file of the given size.
 *
 * Files below the multipart threshold get zero parts (single-shot). Otherwise all parts have length
 * chunkSize, except for the last one which gets the remainder.
 *
 * @chunkSizeOverride 0 to use the chunk size of the matching size tier.
 * @concurrencyOverride 0 to use the concurrency of the matching size tier; clamped to the allowed
 * 		range in any case.
 * @throw UploadException with type UploadErr_INVALIDPOLICY if the resulting parts would violate
 * 		backend limits.
 */
void PartPlanner::plan(uint64_t totalSize, uint64_t chunkSizeOverride,
	unsigned concurrencyOverride, PartPlan& outPlan) const
{
	outPlan = PartPlan();

	if(!totalSize || (totalSize < config.sizePolicy.multipartThreshold) )
	{ // single-shot upload
		LOGGER(Log_DEBUG, "Planned single-shot upload. "
			"FileSize: " << totalSize << "; "
			"Threshold: " << config.sizePolicy.multipartThreshold << std::endl);
		return;
	}

	uint64_t chunkSize;
	unsigned concurrency;

	try
	{
		const SizeTier& tier = config.sizePolicy.findTier(totalSize);

		chunkSize = chunkSizeOverride ? chunkSizeOverride : tier.chunkSize;
		concurrency = concurrencyOverride ? concurrencyOverride : tier.concurrency;
	}
	catch(ProgException& e)
	{
		throw UploadException(UploadErr_INVALIDPOLICY, e.what() );
	}

	if(!chunkSize)
		throw UploadException(UploadErr_INVALIDPOLICY, "Chunk size may not be zero.");

	const uint64_t numParts = (totalSize + chunkSize - 1) / chunkSize;

	checkPlan(totalSize, chunkSize, numParts);

	outPlan.chunkSize = chunkSize;
	outPlan.concurrency = config.clampConcurrency(concurrency);
	outPlan.parts.reserve(numParts);

	for(uint64_t i=0; i < numParts; i++)
	{
		PartRecord part;
		part.partNumber = i + 1;
		part.offset = i * chunkSize;
		part.length = (i == (numParts - 1) ) ? (totalSize - part.offset) : chunkSize;

		outPlan.parts.push_back(part);
	}

	LOGGER(Log_DEBUG, "Planned multipart upload. "
		"FileSize: " << totalSize << "; "
		"ChunkSize: " << chunkSize << "; "
		"NumParts: " << numParts << "; "
		"Concurrency: " << outPlan.concurrency << std::endl);
}

/**
 * @throw UploadException with type UploadErr_INVALIDPOLICY if the plan violates backend limits.
 */
void PartPlanner::checkPlan(uint64_t totalSize, uint64_t chunkSize, uint64_t numParts) const
{
	// (only non-final parts need to satisfy the minimum)
	if( (numParts > 1) && (chunkSize < config.minPartSize) )
		throw UploadException(UploadErr_INVALIDPOLICY, "Chunk size is below the backend minimum "
			"part size. "
			"ChunkSize: " + std::to_string(chunkSize) + "; "
			"MinPartSize: " + std::to_string(config.minPartSize) + "; "
			"FileSize: " + std::to_string(totalSize) );

	if(chunkSize > config.maxPartSize)
		throw UploadException(UploadErr_INVALIDPOLICY, "Chunk size exceeds the backend maximum "
			"part size. "
			"ChunkSize: " + std::to_string(chunkSize) + "; "
			"MaxPartSize: " + std::to_string(config.maxPartSize) );

	if(numParts > config.maxNumParts)
		throw UploadException(UploadErr_INVALIDPOLICY, "Number of parts exceeds the backend "
			"maximum. Consider a larger chunk size. "
			"NumParts: " + std::to_string(numParts) + "; "
			"MaxNumParts: " + std::to_string(config.maxNumParts) + "; "
			"ChunkSize: " + std::to_string(chunkSize) + "; "
			"FileSize: " + std::to_string(totalSize) );
}
