#ifndef NODEHUB_BROKER_EVENT_NOTIFIER_H
#define NODEHUB_BROKER_EVENT_NOTIFIER_H

#include <string>


/**
 * Reports presence changes and task lifecycle to an external observer.
 * @note All methods have to be exceptionless, failures are only logged.
 */
class event_notifier_interface
{
public:
	virtual ~event_notifier_interface() = default;

	/**
	 * A problem an administrator should look at.
	 * @param desc description of the problem
	 */
	virtual void error(const std::string &desc) = 0;

	/**
	 * A node registered.
	 * @param node_id id of the node
	 * @param name name of the node
	 */
	virtual void node_online(const std::string &node_id, const std::string &name) = 0;

	/**
	 * A node disconnected or expired.
	 * @param node_id id of the node
	 * @param name name of the node
	 */
	virtual void node_offline(const std::string &node_id, const std::string &name) = 0;

	/**
	 * A task changed its state.
	 * @param task_id id of the task
	 * @param status one of DISPATCHED, COMPLETED, FAILED, TIMED_OUT, REJECTED
	 * @param desc optional detail (assignee, error)
	 */
	virtual void task_status(const std::string &task_id, const std::string &status, const std::string &desc = "") = 0;
};

#endif // NODEHUB_BROKER_EVENT_NOTIFIER_H
