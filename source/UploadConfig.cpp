// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <sstream>
#include "ProgException.h"
#include "toolkits/TranslatorTk.h"
#include "toolkits/UnitTk.h"
#include "UploadConfig.h"

#define TIERLIST_ELEM_DELIMITERS	","
#define TIERLIST_FIELD_DELIMITER	":"


/**
 * Default policy: single-shot below 64MiB; 8MiB x10 up to 1GiB; 32MiB x5 up to 10GiB; 64MiB x2
 * beyond.
 */
SizePolicy SizePolicy::getDefault()
{
	SizePolicy policy;

	policy.multipartThreshold = UPLOADCONFIG_MULTIPART_THRESHOLD;

	policy.tiers.push_back( {1 * UPLOADCONFIG_GIB, 8 * UPLOADCONFIG_MIB, 10} );
	policy.tiers.push_back( {10 * UPLOADCONFIG_GIB, 32 * UPLOADCONFIG_MIB, 5} );
	policy.tiers.push_back( {0, 64 * UPLOADCONFIG_MIB, 2} );

	return policy;
}

/**
 * Parse a comma-separated tier list. Element format is "UPPERBOUND:CHUNK:THREADS", where
 * UPPERBOUND and CHUNK may have human size suffixes (e.g. "1G:8M:10") and the UPPERBOUND of the
 * last element is UPLOADCONFIG_TIER_UNBOUNDED_STR.
 *
 * @throw ProgException on parse error.
 */
void SizePolicy::parseTierList(const std::string& tierListStr, SizeTierVec& outTiers)
{
	StringVec tierStrVec;

	TranslatorTk::splitAndTrimStr(tierListStr, TIERLIST_ELEM_DELIMITERS, tierStrVec);

	if(tierStrVec.empty() )
		throw ProgException("Size tier list is empty.");

	outTiers.clear();

	for(const std::string& tierStr : tierStrVec)
	{
		StringVec fieldVec;

		boost::split(fieldVec, tierStr, boost::is_any_of(TIERLIST_FIELD_DELIMITER) );

		if(fieldVec.size() != 3)
			throw ProgException("Invalid size tier. Expected format is UPPERBOUND:CHUNK:THREADS. "
				"Given: \"" + tierStr + "\"");

		for(std::string& field : fieldVec)
			boost::trim(field);

		SizeTier tier;

		if(boost::iequals(fieldVec[0], UPLOADCONFIG_TIER_UNBOUNDED_STR) )
			tier.upperBound = 0;
		else
		{
			tier.upperBound = UnitTk::numHumanToBytesBinary(fieldVec[0], true);

			if(!tier.upperBound)
				throw ProgException("Size tier upper bound may not be zero. "
					"Given: \"" + tierStr + "\"");
		}

		tier.chunkSize = UnitTk::numHumanToBytesBinary(fieldVec[1], true);

		try
		{
			tier.concurrency = std::stoul(fieldVec[2] );
		}
		catch(std::exception& e)
		{
			throw ProgException("Invalid size tier concurrency. "
				"Given: \"" + tierStr + "\"");
		}

		outTiers.push_back(tier);
	}
}

/**
 * Find the tier that applies to the given file size: the first one with totalSize below its upper
 * bound, or the unbounded last one.
 *
 * @throw ProgException if no tier matches, which means the tier list is misconfigured.
 */
const SizeTier& SizePolicy::findTier(uint64_t totalSize) const
{
	for(const SizeTier& tier : tiers)
	{
		if(!tier.upperBound || (totalSize < tier.upperBound) )
			return tier;
	}

	throw ProgException("No size tier matches the given file size. "
		"FileSize: " + std::to_string(totalSize) + "; "
		"Tiers: " + tiersToString() );
}

std::string SizePolicy::tiersToString() const
{
	std::ostringstream stream;

	for(size_t i=0; i < tiers.size(); i++)
	{
		if(i)
			stream << ",";

		if(tiers[i].upperBound)
			stream << tiers[i].upperBound;
		else
			stream << UPLOADCONFIG_TIER_UNBOUNDED_STR;

		stream << ":" << tiers[i].chunkSize << ":" << tiers[i].concurrency;
	}

	return stream.str();
}


UploadConfig::UploadConfig() :
	sizePolicy(SizePolicy::getDefault() )
{
}

/**
 * Check configuration for invalid values. Called by UploadOrchestrator on construction, so that
 * configuration errors surface before any network call.
 *
 * @throw ProgException if a problem is found.
 */
void UploadConfig::checkConfig() const
{
	if(sessionDir.empty() )
		throw ProgException("Session store directory is not set.");

	if(!minPartSize)
		throw ProgException("Minimum part size may not be zero.");

	if(maxPartSize < minPartSize)
		throw ProgException("Maximum part size may not be smaller than minimum part size. "
			"MinPartSize: " + std::to_string(minPartSize) + "; "
			"MaxPartSize: " + std::to_string(maxPartSize) );

	if(!maxNumParts)
		throw ProgException("Maximum number of parts may not be zero.");

	if(!maxPartAttempts)
		throw ProgException("Maximum number of part upload attempts may not be zero.");

	if(!callTimeoutMS)
		throw ProgException("Backend call timeout may not be zero.");

	if(sizePolicy.tiers.empty() )
		throw ProgException("Size policy has no tiers.");

	if(sizePolicy.tiers.back().upperBound)
		throw ProgException("Last size tier must be unbounded (\"" UPLOADCONFIG_TIER_UNBOUNDED_STR
			"\"). Tiers: " + sizePolicy.tiersToString() );

	uint64_t lastUpperBound = 0;

	for(size_t i=0; i < sizePolicy.tiers.size(); i++)
	{
		const SizeTier& tier = sizePolicy.tiers[i];

		if(!tier.upperBound && (i != (sizePolicy.tiers.size() - 1) ) )
			throw ProgException("Only the last size tier may be unbounded. "
				"Tiers: " + sizePolicy.tiersToString() );

		if(tier.upperBound && (tier.upperBound <= lastUpperBound) )
			throw ProgException("Size tiers must be ordered by ascending upper bound. "
				"Tiers: " + sizePolicy.tiersToString() );

		if(!tier.chunkSize)
			throw ProgException("Size tier chunk size may not be zero. "
				"Tiers: " + sizePolicy.tiersToString() );

		if(!tier.concurrency)
			throw ProgException("Size tier concurrency may not be zero. "
				"Tiers: " + sizePolicy.tiersToString() );

		lastUpperBound = tier.upperBound;
	}

	if( (sseAlgorithm != UPLOADCONFIG_SSE_NONE) && (sseAlgorithm != UPLOADCONFIG_SSE_AES256) )
		throw ProgException("Unsupported server-side encryption algorithm: \"" + sseAlgorithm +
			"\". Valid values: \"" UPLOADCONFIG_SSE_AES256 "\" or empty.");

	if(accessKey.empty() != secretKey.empty() )
		throw ProgException("Access key and secret key must be given together.");
}

/**
 * @throw ProgException if no bucket is configured for the given role.
 */
const std::string& UploadConfig::getBucketName(BucketRole bucketRole) const
{
	if( (bucketRole < 0) || (bucketRole >= BucketRole_NUMROLES) )
		throw ProgException("Invalid bucket role: " + std::to_string(bucketRole) );

	const std::string& bucketName = bucketNames[bucketRole];

	if(bucketName.empty() )
		throw ProgException("No bucket configured for role: " +
			TranslatorTk::bucketRoleToStr(bucketRole) );

	return bucketName;
}

void UploadConfig::setBucketName(BucketRole bucketRole, const std::string& bucketName)
{
	if( (bucketRole < 0) || (bucketRole >= BucketRole_NUMROLES) )
		throw ProgException("Invalid bucket role: " + std::to_string(bucketRole) );

	bucketNames[bucketRole] = bucketName;
}

/**
 * Clamp a concurrency value (from size policy or caller override) to
 * [UPLOADCONFIG_MIN_CONCURRENCY, UPLOADCONFIG_MAX_CONCURRENCY].
 */
unsigned UploadConfig::clampConcurrency(unsigned concurrency) const
{
	if(concurrency < UPLOADCONFIG_MIN_CONCURRENCY)
		return UPLOADCONFIG_MIN_CONCURRENCY;

	if(concurrency > UPLOADCONFIG_MAX_CONCURRENCY)
		return UPLOADCONFIG_MAX_CONCURRENCY;

	return concurrency;
}

/**
 * Exponential backoff: retryBaseMS after the first failed attempt, doubled for each further one.
 *
 * @numAttemptsDone number of failed attempts so far (>=1).
 */
uint64_t UploadConfig::getRetryDelayMS(unsigned numAttemptsDone) const
{
	if(!numAttemptsDone)
		return 0;

	unsigned shift = std::min(numAttemptsDone - 1, 20U); // (cap to avoid overflow)

	return (uint64_t)retryBaseMS << shift;
}
