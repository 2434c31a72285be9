// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#ifndef COORDINATOR_H_
#define COORDINATOR_H_

#include <chrono>
#include <functional>
#include "ProgArgs.h"
#include "UploadOrchestrator.h"


/**
 * Runs the command that the user selected on the command line. Uploads run in a separate thread,
 * so that the main thread can turn an interrupt signal (ctrl+c) into a cooperative abort.
 */
class Coordinator
{
	public:
		explicit Coordinator(ProgArgs& progArgs) : progArgs(progArgs) {};

		int main();

	private:
		ProgArgs& progArgs;
		std::chrono::steady_clock::time_point progressStartT;

		void runCommand(UploadOrchestrator& orchestrator);
		UploadResult runUploadCommand(UploadOrchestrator& orchestrator,
			const std::string& sessionID, std::function<UploadResult()> uploadFunc);
		UploadResult watchUploadThread(UploadOrchestrator& orchestrator,
			const std::string& sessionID, std::function<UploadResult()> uploadFunc);
		void printUploadResult(const UploadResult& result);
		void printProgress(const std::string& sessionID, const ProgressSnapshot& snapshot);
		void printSessionList(const UploadSessionVec& sessions);
		void printRemoteUploadList(const RemoteUploadVec& remoteUploads);
		void printObjectInfo(const std::string& objectKey, const ObjectInfo& info);
		ProgressCallback makeProgressCallback();
};

#endif /* COORDINATOR_H_ */
